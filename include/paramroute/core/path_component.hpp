#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include "paramroute/util/bytes.hpp"

namespace paramroute {

// ============================================================================
// RawCodec - Registration-time handle on a type's raw-bytes conversion
// ============================================================================

struct RawCodec {
    std::type_index type = typeid(void);
    std::size_t fixed_size = 0;               // 0 for variable length
    bool (*accepts)(ByteView bytes) = nullptr; // decode would succeed

    template<typename T>
    bool holds() const noexcept { return type == std::type_index(typeid(T)); }

    bool operator==(const RawCodec& other) const noexcept {
        return type == other.type && fixed_size == other.fixed_size;
    }
};

template<LosslessBytesConvertible T>
RawCodec raw_codec_of() {
    return RawCodec{
        std::type_index(typeid(T)),
        LosslessBytes<T>::fixed_size,
        [](ByteView bytes) { return LosslessBytes<T>::decode(bytes).has_value(); },
    };
}

// ============================================================================
// PathComponent - One segment of a route being registered
// ============================================================================

class PathComponent {
public:
    enum class Kind {
        Constant,  // literal segment, "users"
        Parameter, // dynamic segment, "{id}"
        Anything,  // any single segment, "*"
        CatchAll   // the rest of the path, "**"
    };

private:
    Kind kind_ = Kind::Constant;
    std::string value_;
    std::optional<RawCodec> codec_;

    PathComponent(Kind kind, std::string value, std::optional<RawCodec> codec)
        : kind_(kind), value_(std::move(value)), codec_(std::move(codec)) {}

public:
    static PathComponent constant(std::string value) {
        return PathComponent(Kind::Constant, std::move(value), std::nullopt);
    }

    // Typed dynamic segment: the slug plus the raw-bytes codec of its backing type.
    static PathComponent parameter(std::string slug, RawCodec codec) {
        return PathComponent(Kind::Parameter, std::move(slug), std::move(codec));
    }

    // Dynamic segment known only by name (e.g. parsed from a pattern string).
    static PathComponent parameter(std::string slug) {
        return PathComponent(Kind::Parameter, std::move(slug), std::nullopt);
    }

    static PathComponent anything() {
        return PathComponent(Kind::Anything, "*", std::nullopt);
    }

    static PathComponent catch_all() {
        return PathComponent(Kind::CatchAll, "**", std::nullopt);
    }

    Kind kind() const noexcept { return kind_; }
    bool is_parameter() const noexcept { return kind_ == Kind::Parameter; }

    // Literal text for constants, slug for parameters.
    const std::string& value() const noexcept { return value_; }

    // Present only for typed parameters.
    const RawCodec* codec() const noexcept { return codec_ ? &*codec_ : nullptr; }

    // Router pattern syntax: "users", "{id}", "*", "**".
    std::string to_pattern() const;

    bool operator==(const PathComponent& other) const noexcept {
        return kind_ == other.kind_ && value_ == other.value_ && codec_ == other.codec_;
    }
};

using PathComponents = std::vector<PathComponent>;

// "/users/{int32}/posts" - a leading slash, components joined by '/'.
std::string to_route_pattern(const PathComponents& components);

// Split a pattern such as "/users/{id}/files/**" or "users/:id" into
// components. Empty segments are skipped.
PathComponents parse_path(std::string_view pattern);

// Slugs of the parameter components, in route order.
std::vector<std::string> parameter_slugs(const PathComponents& components);

} // namespace paramroute
