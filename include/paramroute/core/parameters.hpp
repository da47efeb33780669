#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "paramroute/core/error.hpp"
#include "paramroute/core/logging.hpp"
#include "paramroute/core/parameter.hpp"
#include "paramroute/core/path_component.hpp"
#include "paramroute/util/expected.hpp"

namespace paramroute {

// Raw text captured for one dynamic segment, tagged with its slug.
struct ParameterValue {
    std::string slug;
    std::string value;

    bool operator==(const ParameterValue&) const = default;
};

// ============================================================================
// ParameterValues - Dynamic segments of one matched request, in route order
// ============================================================================
//
//     auto values = ParameterValues::from_match(route.components, match.params);
//     if (!values) return Response::from(values.error());
//     auto id = values->next<std::int64_t>();
//
// Handlers consume values front to back with next<T>(); each call checks the
// slug against T before converting.

class ParameterValues {
    std::vector<ParameterValue> values_;
    std::size_t cursor_ = 0;

public:
    ParameterValues() = default;
    explicit ParameterValues(std::vector<ParameterValue> values)
        : values_(std::move(values)) {}

    // Pair the parameter components of a registered route with the segments
    // the router captured for it.
    static expected<ParameterValues, RoutingError>
    from_match(const PathComponents& route, const std::vector<std::string>& captured);

    void append(std::string slug, std::string value) {
        values_.push_back(ParameterValue{std::move(slug), std::move(value)});
    }

    // Resolve the next unconsumed value as T. The cursor only moves on success.
    template<RouteParameter T>
    expected<resolved_parameter_t<T>, RoutingError> next() {
        if (cursor_ >= values_.size()) {
            return unexpected(failed(RoutingError::insufficient_parameters(), routing_slug<T>()));
        }

        const auto& current = values_[cursor_];
        auto slug = routing_slug<T>();
        if (current.slug != slug) {
            return unexpected(failed(RoutingError::type_mismatch(slug, current.slug), slug));
        }

        auto resolved = resolve_parameter<T>(current.value);
        if (!resolved) {
            return unexpected(failed(std::move(resolved).error(), slug));
        }

        ++cursor_;
        return resolved;
    }

    // Raw text of the first value carrying this slug.
    std::optional<std::string_view> raw(std::string_view slug) const;

    const std::vector<ParameterValue>& values() const noexcept { return values_; }
    std::size_t size() const noexcept { return values_.size(); }
    std::size_t remaining() const noexcept { return values_.size() - cursor_; }
    bool empty() const noexcept { return values_.empty(); }

    // Start consuming from the first value again.
    void rewind() noexcept { cursor_ = 0; }

private:
    static RoutingError failed(RoutingError error, std::string_view slug);
};

} // namespace paramroute
