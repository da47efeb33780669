/**
 * Resolve a raw path segment against one of the built-in parameter types.
 *
 *   resolve_param int32 42
 *   resolve_param uuid 550E8400-E29B-41D4-A716-446655440000
 *   resolve_param --list
 *
 * Prints the resolved value on success. On failure prints the JSON body a
 * router would answer with and exits 1.
 */

#include <paramroute/paramroute.hpp>

#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <type_traits>

using namespace paramroute;

namespace {

using Resolver = std::function<expected<std::string, RoutingError>(std::string_view)>;

template<typename T>
std::string format_value(const T& value) {
    std::ostringstream oss;
    if constexpr (sizeof(T) == 1 && std::is_integral_v<T>) {
        oss << static_cast<int>(value);
    } else {
        oss.precision(17);
        oss << value;
    }
    return oss.str();
}

template<RouteParameter T>
void register_type(std::map<std::string, Resolver>& table) {
    table.emplace(routing_slug<T>(), [](std::string_view raw) {
        return resolve_parameter<T>(raw).transform([](const auto& value) {
            return format_value(value);
        });
    });
}

std::map<std::string, Resolver> builtin_table() {
    std::map<std::string, Resolver> table;
    register_type<std::string>(table);
    register_type<std::int8_t>(table);
    register_type<std::int16_t>(table);
    register_type<std::int32_t>(table);
    register_type<std::int64_t>(table);
    register_type<std::uint8_t>(table);
    register_type<std::uint16_t>(table);
    register_type<std::uint32_t>(table);
    register_type<std::uint64_t>(table);
    register_type<float>(table);
    register_type<double>(table);
    register_type<Uuid>(table);
    return table;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Config::from_env().apply();

    auto table = builtin_table();

    if (argc == 2 && std::string_view(argv[1]) == "--list") {
        for (const auto& [slug, resolver] : table) {
            std::cout << slug << "\n";
        }
        return 0;
    }

    if (argc != 3) {
        std::cerr << "usage: " << argv[0] << " <slug> <raw-segment>\n"
                  << "       " << argv[0] << " --list\n";
        return 2;
    }

    auto it = table.find(argv[1]);
    if (it == table.end()) {
        log_error("unknown parameter slug: " + std::string(argv[1]));
        return 2;
    }

    auto result = it->second(argv[2]);
    if (!result) {
        log_debug(result.error().to_string());
        std::cout << result.error().to_json() << "\n";
        return 1;
    }

    std::cout << *result << "\n";
    return 0;
}
