#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "paramroute/core/error.hpp"
#include "paramroute/core/path_component.hpp"
#include "paramroute/util/bytes.hpp"
#include "paramroute/util/expected.hpp"
#include "paramroute/util/type_name.hpp"
#include "paramroute/util/uuid.hpp"

namespace paramroute {

// ============================================================================
// Parameter trait - A type usable as a dynamic route segment
// ============================================================================
//
// A type takes part in routing by specializing Parameter<T>. Deriving the
// specialization from ParameterDefaults supplies everything except resolve():
//
//     template<>
//     struct paramroute::Parameter<Widget> : paramroute::ParameterDefaults<Widget> {
//         static expected<Widget, RoutingError> resolve(std::string_view raw);
//     };
//
//     router.get(to_route_pattern({PathComponent::constant("widgets"),
//                                  path_component<Widget>()}), ...);  // "/widgets/{widget}"
//
// resolved_type is what resolve() hands to the request handler. raw_type is
// the backing type whose raw-bytes conversion the route registration uses;
// for most types both are the type itself.

template<typename T, typename = void>
struct Parameter;

template<typename Self, typename Resolved = Self, typename Raw = Self>
struct ParameterDefaults {
    using resolved_type = Resolved;
    using raw_type = Raw;

    // Name used in error messages. Defaults to the unqualified type name.
    static constexpr std::string_view display_name() noexcept {
        return type_name<Self>();
    }

    // Placeholder key of this parameter in a route pattern.
    static std::string routing_slug() {
        return to_lower(Parameter<Self>::display_name());
    }
};

template<typename T>
concept RouteParameter = requires(std::string_view raw) {
    typename Parameter<T>::resolved_type;
    typename Parameter<T>::raw_type;
    { Parameter<T>::routing_slug() } -> std::convertible_to<std::string>;
    { Parameter<T>::resolve(raw) }
        -> std::same_as<expected<typename Parameter<T>::resolved_type, RoutingError>>;
} && LosslessBytesConvertible<typename Parameter<T>::raw_type>;

template<RouteParameter T>
using resolved_parameter_t = typename Parameter<T>::resolved_type;

template<RouteParameter T>
std::string routing_slug() {
    return Parameter<T>::routing_slug();
}

// Descriptor for registering T as a dynamic segment.
template<RouteParameter T>
PathComponent path_component() {
    return PathComponent::parameter(routing_slug<T>(),
                                    raw_codec_of<typename Parameter<T>::raw_type>());
}

// Convert the text matched for a dynamic segment into T's resolved value.
template<RouteParameter T>
expected<resolved_parameter_t<T>, RoutingError> resolve_parameter(std::string_view raw) {
    return Parameter<T>::resolve(raw);
}

// ============================================================================
// Shared conversion routines
// ============================================================================

namespace detail {

template<typename T>
inline constexpr bool is_parameter_integer_v =
    std::is_integral_v<T> && sizeof(T) <= 8 &&
    !std::is_same_v<T, bool> &&
    !std::is_same_v<T, char> &&
    !std::is_same_v<T, wchar_t> &&
    !std::is_same_v<T, char8_t> &&
    !std::is_same_v<T, char16_t> &&
    !std::is_same_v<T, char32_t>;

template<typename T>
inline constexpr bool is_parameter_floating_v =
    std::is_same_v<T, float> || std::is_same_v<T, double>;

// Integers are named by width and signedness, so platform-width aliases
// (long, long long, std::intptr_t) share the name of their fixed-width twin.
template<typename T>
constexpr std::string_view integer_display_name() noexcept {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return "Int8";
        else if constexpr (sizeof(T) == 2) return "Int16";
        else if constexpr (sizeof(T) == 4) return "Int32";
        else return "Int64";
    } else {
        if constexpr (sizeof(T) == 1) return "UInt8";
        else if constexpr (sizeof(T) == 2) return "UInt16";
        else if constexpr (sizeof(T) == 4) return "UInt32";
        else return "UInt64";
    }
}

// Base-10 literal for exactly T's width and signedness. One leading '+'
// is allowed; anything left unconsumed is a failure.
template<typename T>
std::optional<T> parse_integer(std::string_view s) noexcept {
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        if (!s.empty() && s.front() == '-') return std::nullopt;
    }
    if (s.empty()) return std::nullopt;

    // "-0", "-00", ... are zero for unsigned targets too.
    if constexpr (std::is_unsigned_v<T>) {
        if (s.size() > 1 && s.front() == '-' &&
            s.find_first_not_of('0', 1) == std::string_view::npos) {
            return T{0};
        }
    }

    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// Whole-string double literal: decimal, exponent, hexadecimal, inf, nan.
// Always uses '.' as the decimal point, whatever the process locale.
// Magnitudes beyond double's range saturate instead of failing.
std::optional<double> parse_double(std::string_view s);

template<typename T>
expected<T, RoutingError> resolve_integer(std::string_view raw) {
    if (auto value = parse_integer<T>(raw)) {
        return *value;
    }
    return unexpected(RoutingError::invalid_integer(Parameter<T>::display_name()));
}

template<typename T>
expected<T, RoutingError> resolve_floating(std::string_view raw) {
    if (auto value = parse_double(raw)) {
        return static_cast<T>(*value);
    }
    return unexpected(RoutingError::invalid_float(Parameter<T>::display_name()));
}

} // namespace detail

// ============================================================================
// Built-in conformances
// ============================================================================

template<>
struct Parameter<std::string> : ParameterDefaults<std::string> {
    static constexpr std::string_view display_name() noexcept { return "String"; }

    static expected<std::string, RoutingError> resolve(std::string_view raw) {
        return std::string(raw);
    }
};

template<typename T>
struct Parameter<T, std::enable_if_t<detail::is_parameter_integer_v<T>>> : ParameterDefaults<T> {
    static constexpr std::string_view display_name() noexcept {
        return detail::integer_display_name<T>();
    }

    static expected<T, RoutingError> resolve(std::string_view raw) {
        return detail::resolve_integer<T>(raw);
    }
};

template<typename T>
struct Parameter<T, std::enable_if_t<detail::is_parameter_floating_v<T>>> : ParameterDefaults<T> {
    static constexpr std::string_view display_name() noexcept {
        if constexpr (std::is_same_v<T, float>) return "Float";
        else return "Double";
    }

    static expected<T, RoutingError> resolve(std::string_view raw) {
        return detail::resolve_floating<T>(raw);
    }
};

template<>
struct Parameter<Uuid> : ParameterDefaults<Uuid> {
    static constexpr std::string_view display_name() noexcept { return "UUID"; }

    static expected<Uuid, RoutingError> resolve(std::string_view raw) {
        if (auto uuid = Uuid::parse(raw)) {
            return *uuid;
        }
        return unexpected(RoutingError::invalid_uuid());
    }
};

} // namespace paramroute
