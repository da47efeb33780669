#include "paramroute/core/path_component.hpp"

namespace paramroute {

std::string PathComponent::to_pattern() const {
    switch (kind_) {
        case Kind::Constant: return value_;
        case Kind::Parameter: return "{" + value_ + "}";
        case Kind::Anything: return "*";
        case Kind::CatchAll: return "**";
    }
    return value_;
}

std::string to_route_pattern(const PathComponents& components) {
    if (components.empty()) {
        return "/";
    }

    std::string pattern;
    for (const auto& component : components) {
        pattern += '/';
        pattern += component.to_pattern();
    }
    return pattern;
}

PathComponents parse_path(std::string_view pattern) {
    PathComponents components;

    size_t i = 0;
    while (i <= pattern.size()) {
        size_t end = pattern.find('/', i);
        if (end == std::string_view::npos) {
            end = pattern.size();
        }

        std::string_view segment = pattern.substr(i, end - i);
        if (!segment.empty()) {
            if (segment == "**") {
                components.push_back(PathComponent::catch_all());
            } else if (segment == "*") {
                components.push_back(PathComponent::anything());
            } else if (segment.size() > 2 && segment.front() == '{' && segment.back() == '}') {
                components.push_back(PathComponent::parameter(
                    std::string(segment.substr(1, segment.size() - 2))));
            } else if (segment.size() > 1 && segment.front() == ':') {
                components.push_back(PathComponent::parameter(std::string(segment.substr(1))));
            } else {
                components.push_back(PathComponent::constant(std::string(segment)));
            }
        }

        i = end + 1;
    }

    return components;
}

std::vector<std::string> parameter_slugs(const PathComponents& components) {
    std::vector<std::string> slugs;
    for (const auto& component : components) {
        if (component.is_parameter()) {
            slugs.push_back(component.value());
        }
    }
    return slugs;
}

} // namespace paramroute
