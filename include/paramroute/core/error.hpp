#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace paramroute {

// ============================================================================
// Routing error codes
// ============================================================================

enum class RoutingErrc {
    // Conversion failures: the client supplied a malformed segment
    InvalidInteger = 1,
    InvalidFloat,
    InvalidUuid,

    // Route wiring failures: the handler asked for something the route
    // does not provide
    InsufficientParameters,
    TypeMismatch,
    CountMismatch,

    // Raised by user-defined parameter conformances
    Custom
};

} // namespace paramroute

// Enable std::error_code integration - MUST be before make_error_code declarations
template<>
struct std::is_error_code_enum<paramroute::RoutingErrc> : std::true_type {};

namespace paramroute {

const std::error_category& routing_error_category() noexcept;
std::error_code make_error_code(RoutingErrc e) noexcept;

// Short identifier tag for a code: "fwi", "bfp", "uuid", "next", "type", "count".
std::string_view routing_identifier(RoutingErrc e) noexcept;

// ============================================================================
// RoutingError - Failure to turn a path segment into a typed value
// ============================================================================

class RoutingError {
    RoutingErrc code_ = RoutingErrc::Custom;
    std::string identifier_;
    std::string reason_;

    RoutingError(RoutingErrc code, std::string reason)
        : code_(code),
          identifier_(routing_identifier(code)),
          reason_(std::move(reason)) {}

public:
    // For user conformances: any identifier, reported as RoutingErrc::Custom.
    RoutingError(std::string identifier, std::string reason)
        : identifier_(std::move(identifier)), reason_(std::move(reason)) {}

    // Factory methods
    static RoutingError invalid_integer(std::string_view type_name);
    static RoutingError invalid_float(std::string_view type_name);
    static RoutingError invalid_uuid();
    static RoutingError insufficient_parameters();
    static RoutingError type_mismatch(std::string_view expected_slug, std::string_view actual_slug);
    static RoutingError count_mismatch(std::size_t expected, std::size_t actual);

    // Accessors
    RoutingErrc errc() const noexcept { return code_; }
    std::error_code code() const noexcept { return make_error_code(code_); }
    const std::string& identifier() const noexcept { return identifier_; }
    const std::string& reason() const noexcept { return reason_; }

    // True when the client sent a segment that could not be converted.
    bool is_conversion_failure() const noexcept {
        return code_ == RoutingErrc::InvalidInteger ||
               code_ == RoutingErrc::InvalidFloat ||
               code_ == RoutingErrc::InvalidUuid ||
               code_ == RoutingErrc::Custom;
    }

    // HTTP status a router should answer with: 400 for bad input,
    // 500 when the route and handler disagree.
    int http_status() const noexcept {
        return is_conversion_failure() ? 400 : 500;
    }

    // "RoutingError.<identifier>: <reason>"
    std::string to_string() const;

    // {"error":true,"identifier":"...","reason":"...","status":400}
    std::string to_json() const;

    bool operator==(const RoutingError& other) const noexcept {
        return code_ == other.code_ && identifier_ == other.identifier_ &&
               reason_ == other.reason_;
    }
};

} // namespace paramroute
