#include "paramroute/core/error.hpp"

#include <nlohmann/json.hpp>

namespace paramroute {

// ============================================================================
// Routing error category
// ============================================================================

namespace {

class RoutingErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "paramroute.routing";
    }

    std::string message(int ev) const override {
        switch (static_cast<RoutingErrc>(ev)) {
            case RoutingErrc::InvalidInteger: return "Parameter is not a valid integer";
            case RoutingErrc::InvalidFloat: return "Parameter is not a valid floating point number";
            case RoutingErrc::InvalidUuid: return "Parameter is not a valid UUID";
            case RoutingErrc::InsufficientParameters: return "Insufficient parameters";
            case RoutingErrc::TypeMismatch: return "Parameter type mismatch";
            case RoutingErrc::CountMismatch: return "Parameter count mismatch";
            case RoutingErrc::Custom: return "Parameter conversion failed";
            default: return "Unknown routing error";
        }
    }
};

const RoutingErrorCategory routing_category_instance{};

} // anonymous namespace

const std::error_category& routing_error_category() noexcept {
    return routing_category_instance;
}

std::error_code make_error_code(RoutingErrc e) noexcept {
    return {static_cast<int>(e), routing_error_category()};
}

std::string_view routing_identifier(RoutingErrc e) noexcept {
    switch (e) {
        case RoutingErrc::InvalidInteger: return "fwi";
        case RoutingErrc::InvalidFloat: return "bfp";
        case RoutingErrc::InvalidUuid: return "uuid";
        case RoutingErrc::InsufficientParameters: return "next";
        case RoutingErrc::TypeMismatch: return "type";
        case RoutingErrc::CountMismatch: return "count";
        case RoutingErrc::Custom: return "custom";
    }
    return "unknown";
}

// ============================================================================
// RoutingError Implementation
// ============================================================================

RoutingError RoutingError::invalid_integer(std::string_view type_name) {
    return RoutingError(RoutingErrc::InvalidInteger,
        "The parameter was not convertible to a " + std::string(type_name));
}

RoutingError RoutingError::invalid_float(std::string_view type_name) {
    return RoutingError(RoutingErrc::InvalidFloat,
        "The parameter was not convertible to a " + std::string(type_name));
}

RoutingError RoutingError::invalid_uuid() {
    return RoutingError(RoutingErrc::InvalidUuid,
        "The parameter was not convertible to a UUID");
}

RoutingError RoutingError::insufficient_parameters() {
    return RoutingError(RoutingErrc::InsufficientParameters, "Insufficient parameters.");
}

RoutingError RoutingError::type_mismatch(std::string_view expected_slug, std::string_view actual_slug) {
    return RoutingError(RoutingErrc::TypeMismatch,
        "Invalid parameter type: " + std::string(expected_slug) + " != " + std::string(actual_slug));
}

RoutingError RoutingError::count_mismatch(std::size_t expected, std::size_t actual) {
    return RoutingError(RoutingErrc::CountMismatch,
        "Route declares " + std::to_string(expected) + " parameters but " +
        std::to_string(actual) + " segments were captured");
}

std::string RoutingError::to_string() const {
    return "RoutingError." + identifier_ + ": " + reason_;
}

std::string RoutingError::to_json() const {
    nlohmann::json body = {
        {"error", true},
        {"identifier", identifier_},
        {"reason", reason_},
        {"status", http_status()},
    };
    // Reasons may echo raw path text, which is not guaranteed to be UTF-8.
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace paramroute
