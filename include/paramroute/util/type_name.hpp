#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace paramroute {

namespace detail {

// Signature of this function as the compiler spells it, e.g.
//   GCC:   "... type_signature() [with T = ns::Widget]"
//   Clang: "... type_signature() [T = ns::Widget]"
//   MSVC:  "... type_signature<struct ns::Widget>(void)"
template<typename T>
constexpr std::string_view type_signature() noexcept {
#if defined(__clang__) || defined(__GNUC__)
    return __PRETTY_FUNCTION__;
#elif defined(_MSC_VER)
    return __FUNCSIG__;
#else
#error "paramroute: unsupported compiler for type_name<T>()"
#endif
}

constexpr std::string_view extract_type_name(std::string_view sig) noexcept {
#if defined(__clang__) || defined(__GNUC__)
    constexpr std::string_view marker = "T = ";
    auto start = sig.find(marker);
    if (start == std::string_view::npos) return {};
    start += marker.size();
    auto end = sig.find_first_of(";]", start);
    return sig.substr(start, end - start);
#else
    constexpr std::string_view marker = "type_signature<";
    auto start = sig.find(marker);
    if (start == std::string_view::npos) return {};
    start += marker.size();
    auto end = sig.rfind(">(void)");
    auto name = sig.substr(start, end - start);
    for (std::string_view prefix : {std::string_view("struct "), std::string_view("class "),
                                    std::string_view("enum ")}) {
        if (name.starts_with(prefix)) {
            name.remove_prefix(prefix.size());
            break;
        }
    }
    return name;
#endif
}

// Drop namespace and enclosing-class qualifiers that sit outside any
// template argument list.
constexpr std::string_view strip_qualifiers(std::string_view name) noexcept {
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '<' || c == '(') {
            ++depth;
        } else if (c == '>' || c == ')') {
            --depth;
        } else if (depth == 0 && c == ':' && i + 1 < name.size() && name[i + 1] == ':') {
            start = i + 2;
            ++i;
        }
    }
    return name.substr(start);
}

} // namespace detail

// Fully qualified name of T as the compiler spells it.
template<typename T>
constexpr std::string_view qualified_type_name() noexcept {
    return detail::extract_type_name(detail::type_signature<T>());
}

// Name of T without namespace qualifiers: ns::Widget -> "Widget".
template<typename T>
constexpr std::string_view type_name() noexcept {
    return detail::strip_qualifiers(qualified_type_name<T>());
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace paramroute
