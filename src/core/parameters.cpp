#include "paramroute/core/parameters.hpp"

namespace paramroute {

expected<ParameterValues, RoutingError>
ParameterValues::from_match(const PathComponents& route, const std::vector<std::string>& captured) {
    auto slugs = parameter_slugs(route);
    if (slugs.size() != captured.size()) {
        return unexpected(failed(RoutingError::count_mismatch(slugs.size(), captured.size()),
                                 to_route_pattern(route)));
    }

    ParameterValues values;
    for (std::size_t i = 0; i < slugs.size(); ++i) {
        values.append(std::move(slugs[i]), captured[i]);
    }
    return values;
}

std::optional<std::string_view> ParameterValues::raw(std::string_view slug) const {
    for (const auto& value : values_) {
        if (value.slug == slug) {
            return std::string_view(value.value);
        }
    }
    return std::nullopt;
}

RoutingError ParameterValues::failed(RoutingError error, std::string_view slug) {
    auto& logger = default_logger();
    if (logger.is_enabled(LogLevel::Debug)) {
        auto entry = logger.entry(LogLevel::Debug, "route parameter rejected");
        entry.field("identifier", error.identifier())
             .field("slug", std::string(slug))
             .field("reason", error.reason());
        logger.log(entry);
    }
    return error;
}

} // namespace paramroute
