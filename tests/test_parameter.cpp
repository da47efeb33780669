#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <paramroute/core/parameter.hpp>

#include <clocale>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace paramroute;

// ============================================================================
// User-defined parameter types
// ============================================================================

struct Widget {
    int id = 0;
};

namespace shop {
struct Product {
    std::string sku;
};
} // namespace shop

struct User {
    std::int64_t id = 0;
    std::string name;
};

namespace paramroute {

// Picks up the default slug: "widget".
template<>
struct Parameter<Widget> : ParameterDefaults<Widget, Widget, std::int32_t> {
    static expected<Widget, RoutingError> resolve(std::string_view raw) {
        return resolve_parameter<std::int32_t>(raw).transform([](std::int32_t id) {
            return Widget{id};
        });
    }
};

// Overrides the slug.
template<>
struct Parameter<shop::Product> : ParameterDefaults<shop::Product, shop::Product, std::string> {
    static std::string routing_slug() { return "sku"; }

    static expected<shop::Product, RoutingError> resolve(std::string_view raw) {
        if (raw.size() != 6) {
            return unexpected(RoutingError("sku", "A SKU has exactly six characters"));
        }
        return shop::Product{std::string(raw)};
    }
};

// Resolves to a record looked up by its numeric id.
template<>
struct Parameter<User> : ParameterDefaults<User, User, std::int64_t> {
    static expected<User, RoutingError> resolve(std::string_view raw) {
        static const std::map<std::int64_t, std::string> directory = {
            {1, "ada"}, {2, "grace"},
        };
        return resolve_parameter<std::int64_t>(raw).and_then(
            [](std::int64_t id) -> expected<User, RoutingError> {
                auto it = directory.find(id);
                if (it == directory.end()) {
                    return unexpected(RoutingError("user", "No user with id " + std::to_string(id)));
                }
                return User{it->first, it->second};
            });
    }
};

} // namespace paramroute

// ============================================================================
// Capability
// ============================================================================

TEST_CASE("RouteParameter concept", "[parameter]") {
    STATIC_REQUIRE(RouteParameter<std::string>);
    STATIC_REQUIRE(RouteParameter<std::int8_t>);
    STATIC_REQUIRE(RouteParameter<std::uint64_t>);
    STATIC_REQUIRE(RouteParameter<long long>);
    STATIC_REQUIRE(RouteParameter<float>);
    STATIC_REQUIRE(RouteParameter<double>);
    STATIC_REQUIRE(RouteParameter<Uuid>);
    STATIC_REQUIRE(RouteParameter<Widget>);
    STATIC_REQUIRE(RouteParameter<User>);

    STATIC_REQUIRE(!RouteParameter<bool>);
    STATIC_REQUIRE(!RouteParameter<char>);
    STATIC_REQUIRE(!RouteParameter<long double>);
    STATIC_REQUIRE(!RouteParameter<std::vector<int>>);
}

TEST_CASE("Routing slugs", "[parameter]") {
    SECTION("defaults to the lowercase type name") {
        REQUIRE(routing_slug<Widget>() == "widget");
        REQUIRE(routing_slug<User>() == "user");
    }

    SECTION("override") {
        REQUIRE(routing_slug<shop::Product>() == "sku");
    }

    SECTION("built-in types") {
        REQUIRE(routing_slug<std::string>() == "string");
        REQUIRE(routing_slug<std::int8_t>() == "int8");
        REQUIRE(routing_slug<std::int16_t>() == "int16");
        REQUIRE(routing_slug<std::int32_t>() == "int32");
        REQUIRE(routing_slug<std::int64_t>() == "int64");
        REQUIRE(routing_slug<std::uint8_t>() == "uint8");
        REQUIRE(routing_slug<std::uint16_t>() == "uint16");
        REQUIRE(routing_slug<std::uint32_t>() == "uint32");
        REQUIRE(routing_slug<std::uint64_t>() == "uint64");
        REQUIRE(routing_slug<float>() == "float");
        REQUIRE(routing_slug<double>() == "double");
        REQUIRE(routing_slug<Uuid>() == "uuid");
    }

    SECTION("platform-width integers share the fixed-width name") {
        REQUIRE(routing_slug<long long>() == "int64");
        REQUIRE(routing_slug<std::intptr_t>() == (sizeof(std::intptr_t) == 8 ? "int64" : "int32"));
        REQUIRE(routing_slug<std::size_t>() == (sizeof(std::size_t) == 8 ? "uint64" : "uint32"));
    }
}

TEST_CASE("Path component descriptors", "[parameter]") {
    SECTION("built-in type") {
        auto component = path_component<std::int32_t>();
        REQUIRE(component.kind() == PathComponent::Kind::Parameter);
        REQUIRE(component.value() == "int32");
        REQUIRE(component.to_pattern() == "{int32}");
        REQUIRE(component.codec() != nullptr);
        REQUIRE(component.codec()->holds<std::int32_t>());
        REQUIRE(component.codec()->fixed_size == 4);
    }

    SECTION("resolved type differs from the raw backing type") {
        auto component = path_component<User>();
        REQUIRE(component.value() == "user");
        REQUIRE(component.codec()->holds<std::int64_t>());
        REQUIRE(component.codec()->accepts(to_bytes<std::int64_t>(7)));
        REQUIRE(!component.codec()->accepts(to_bytes<std::int32_t>(7)));
    }

    SECTION("variable length backing type") {
        auto component = path_component<shop::Product>();
        REQUIRE(component.value() == "sku");
        REQUIRE(component.codec()->holds<std::string>());
        REQUIRE(component.codec()->fixed_size == 0);
    }

    SECTION("uuid") {
        auto component = path_component<Uuid>();
        REQUIRE(component.codec()->fixed_size == 16);
        REQUIRE(component == path_component<Uuid>());
        REQUIRE(component != path_component<std::string>());
    }
}

// ============================================================================
// String
// ============================================================================

TEST_CASE("String parameters are returned unchanged", "[parameter][string]") {
    REQUIRE(*resolve_parameter<std::string>("hello") == "hello");
    REQUIRE(*resolve_parameter<std::string>("") == "");
    REQUIRE(*resolve_parameter<std::string>("a b%20c") == "a b%20c");
}

// ============================================================================
// Integers
// ============================================================================

TEST_CASE("Integer parameters", "[parameter][integer]") {
    SECTION("int32") {
        auto result = resolve_parameter<std::int32_t>("42");
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("negative") {
        REQUIRE(*resolve_parameter<std::int64_t>("-123") == -123);
    }

    SECTION("leading plus") {
        REQUIRE(*resolve_parameter<std::int32_t>("+7") == 7);
        REQUIRE(*resolve_parameter<std::uint16_t>("+7") == 7);
    }

    SECTION("negative zero") {
        REQUIRE(*resolve_parameter<std::int32_t>("-0") == 0);
        REQUIRE(*resolve_parameter<std::uint32_t>("-0") == 0u);
        REQUIRE(*resolve_parameter<std::uint64_t>("-000") == 0u);
    }

    SECTION("exact range bounds") {
        REQUIRE(*resolve_parameter<std::int8_t>("-128") == -128);
        REQUIRE(*resolve_parameter<std::int8_t>("127") == 127);
        REQUIRE(*resolve_parameter<std::uint8_t>("255") == 255);
        REQUIRE(*resolve_parameter<std::int64_t>("-9223372036854775808") ==
                std::numeric_limits<std::int64_t>::min());
        REQUIRE(*resolve_parameter<std::uint64_t>("18446744073709551615") ==
                std::numeric_limits<std::uint64_t>::max());
    }

    SECTION("round trip to canonical text") {
        for (std::int32_t value : {0, 1, -1, 2147483647, -2147483647 - 1}) {
            auto text = std::to_string(value);
            auto result = resolve_parameter<std::int32_t>(text);
            REQUIRE(result.has_value());
            REQUIRE(std::to_string(*result) == text);
        }
    }
}

TEST_CASE("Integer parameters reject malformed input", "[parameter][integer]") {
    auto rejects = [](auto result, std::string_view reason) {
        REQUIRE(!result.has_value());
        REQUIRE(result.error().identifier() == "fwi");
        REQUIRE(result.error().reason() == reason);
        REQUIRE(result.error().http_status() == 400);
    };

    SECTION("out of range") {
        rejects(resolve_parameter<std::int32_t>("9999999999999999999999"),
                "The parameter was not convertible to a Int32");
        rejects(resolve_parameter<std::int8_t>("128"),
                "The parameter was not convertible to a Int8");
        rejects(resolve_parameter<std::uint8_t>("256"),
                "The parameter was not convertible to a UInt8");
        rejects(resolve_parameter<std::int64_t>("9223372036854775808"),
                "The parameter was not convertible to a Int64");
    }

    SECTION("negative for unsigned") {
        rejects(resolve_parameter<std::uint32_t>("-1"),
                "The parameter was not convertible to a UInt32");
    }

    SECTION("sign on zero for unsigned still needs digits") {
        rejects(resolve_parameter<std::uint8_t>("-"), "The parameter was not convertible to a UInt8");
        rejects(resolve_parameter<std::uint8_t>("-0x"), "The parameter was not convertible to a UInt8");
        rejects(resolve_parameter<std::uint8_t>("+-0"), "The parameter was not convertible to a UInt8");
    }

    SECTION("non-numeric") {
        rejects(resolve_parameter<std::int32_t>("abc"), "The parameter was not convertible to a Int32");
        rejects(resolve_parameter<std::int32_t>("42abc"), "The parameter was not convertible to a Int32");
        rejects(resolve_parameter<std::int32_t>("4.2"), "The parameter was not convertible to a Int32");
        rejects(resolve_parameter<std::int32_t>(" 42"), "The parameter was not convertible to a Int32");
        rejects(resolve_parameter<std::int32_t>("0x10"), "The parameter was not convertible to a Int32");
    }

    SECTION("empty and sign only") {
        rejects(resolve_parameter<std::int16_t>(""), "The parameter was not convertible to a Int16");
        rejects(resolve_parameter<std::int16_t>("-"), "The parameter was not convertible to a Int16");
        rejects(resolve_parameter<std::int16_t>("+"), "The parameter was not convertible to a Int16");
        rejects(resolve_parameter<std::int16_t>("+-1"), "The parameter was not convertible to a Int16");
    }
}

// ============================================================================
// Floating point
// ============================================================================

TEST_CASE("Floating point parameters", "[parameter][float]") {
    SECTION("double") {
        auto result = resolve_parameter<double>("3.14");
        REQUIRE(result.has_value());
        REQUIRE(*result == 3.14);
    }

    SECTION("float narrows without failing") {
        auto result = resolve_parameter<float>("3.14159265358979");
        REQUIRE(result.has_value());
        REQUIRE(*result == Catch::Approx(3.14159265358979f));
        REQUIRE(*result == static_cast<float>(3.14159265358979));
    }

    SECTION("integers and exponents") {
        REQUIRE(*resolve_parameter<double>("42") == 42.0);
        REQUIRE(*resolve_parameter<double>("-2.5") == -2.5);
        REQUIRE(*resolve_parameter<double>("1.5e10") == Catch::Approx(1.5e10));
        REQUIRE(*resolve_parameter<double>(".5") == 0.5);
    }

    SECTION("out of double range saturates") {
        auto result = resolve_parameter<double>("1e999");
        REQUIRE(result.has_value());
        REQUIRE(std::isinf(*result));
    }

    SECTION("out of float range narrows to infinity") {
        auto result = resolve_parameter<float>("1e300");
        REQUIRE(result.has_value());
        REQUIRE(std::isinf(*result));
    }

    SECTION("special values") {
        REQUIRE(std::isinf(*resolve_parameter<double>("inf")));
        REQUIRE(*resolve_parameter<double>("-inf") < 0);
        REQUIRE(std::isnan(*resolve_parameter<double>("nan")));
    }

    SECTION("signs") {
        REQUIRE(*resolve_parameter<double>("+1.5") == 1.5);
        REQUIRE(*resolve_parameter<double>("-0.25") == -0.25);
    }

    SECTION("hexadecimal") {
        REQUIRE(*resolve_parameter<double>("0x1p3") == 8.0);
        REQUIRE(*resolve_parameter<double>("-0X1.8p1") == -3.0);
    }

    SECTION("underflow saturates to zero") {
        auto result = resolve_parameter<double>("1e-999");
        REQUIRE(result.has_value());
        REQUIRE(*result == 0.0);

        auto negative = resolve_parameter<double>("-1e999");
        REQUIRE(std::isinf(*negative));
        REQUIRE(*negative < 0);
    }
}

TEST_CASE("Floating point parameters reject malformed input", "[parameter][float]") {
    for (std::string_view raw : {"", "abc", "3.14abc", " 3.14", "3.14 ", "1,5", "--1",
                                 "+-1", "+", "0x", "0x-1", "1e"}) {
        auto result = resolve_parameter<double>(raw);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().identifier() == "bfp");
        REQUIRE(result.error().reason() == "The parameter was not convertible to a Double");
    }

    auto narrowed = resolve_parameter<float>("pi");
    REQUIRE(!narrowed.has_value());
    REQUIRE(narrowed.error().identifier() == "bfp");
    REQUIRE(narrowed.error().reason() == "The parameter was not convertible to a Float");
}

TEST_CASE("Floating point parameters ignore the process locale", "[parameter][float]") {
    std::string previous = std::setlocale(LC_NUMERIC, nullptr);

    const char* comma_locale = nullptr;
    for (const char* name : {"de_DE.UTF-8", "de_DE.utf8", "de_DE", "fr_FR.UTF-8", "fr_FR.utf8"}) {
        if (std::setlocale(LC_NUMERIC, name) != nullptr) {
            comma_locale = name;
            break;
        }
    }
    if (comma_locale == nullptr) {
        SKIP("no locale with a comma decimal separator is installed");
    }

    auto dotted = resolve_parameter<double>("3.14");
    auto comma = resolve_parameter<double>("1,5");
    std::setlocale(LC_NUMERIC, previous.c_str());

    REQUIRE(dotted.has_value());
    REQUIRE(*dotted == 3.14);
    REQUIRE(!comma.has_value());
    REQUIRE(comma.error().identifier() == "bfp");
}

// ============================================================================
// UUID
// ============================================================================

TEST_CASE("UUID parameters", "[parameter][uuid]") {
    SECTION("canonical form") {
        auto result = resolve_parameter<Uuid>("550e8400-e29b-41d4-a716-446655440000");
        REQUIRE(result.has_value());
        REQUIRE(result->to_string() == "550e8400-e29b-41d4-a716-446655440000");
    }

    SECTION("case-insensitive") {
        auto lower = resolve_parameter<Uuid>("550e8400-e29b-41d4-a716-446655440000");
        auto upper = resolve_parameter<Uuid>("550E8400-E29B-41D4-A716-446655440000");
        REQUIRE(*lower == *upper);
    }

    SECTION("malformed") {
        for (std::string_view raw : {"not-a-uuid", "", "550e8400-e29b-41d4-a716-44665544000"}) {
            auto result = resolve_parameter<Uuid>(raw);
            REQUIRE(!result.has_value());
            REQUIRE(result.error().identifier() == "uuid");
            REQUIRE(result.error().reason() == "The parameter was not convertible to a UUID");
        }
    }
}

// ============================================================================
// User-defined conformances
// ============================================================================

TEST_CASE("User-defined parameters", "[parameter][custom]") {
    SECTION("delegating to a built-in") {
        auto widget = resolve_parameter<Widget>("12");
        REQUIRE(widget.has_value());
        REQUIRE(widget->id == 12);

        auto bad = resolve_parameter<Widget>("twelve");
        REQUIRE(bad.error().identifier() == "fwi");
    }

    SECTION("lookup") {
        auto user = resolve_parameter<User>("2");
        REQUIRE(user.has_value());
        REQUIRE(user->name == "grace");

        auto missing = resolve_parameter<User>("3");
        REQUIRE(!missing.has_value());
        REQUIRE(missing.error().identifier() == "user");
        REQUIRE(missing.error().errc() == RoutingErrc::Custom);
    }

    SECTION("custom validation") {
        REQUIRE(resolve_parameter<shop::Product>("AB1234")->sku == "AB1234");
        REQUIRE(resolve_parameter<shop::Product>("AB12").error().identifier() == "sku");
    }
}

// ============================================================================
// Purity
// ============================================================================

TEST_CASE("Resolution is deterministic across threads", "[parameter]") {
    constexpr int THREADS = 8;
    std::vector<int> ok(THREADS, 0);
    std::vector<std::thread> workers;

    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&ok, t] {
            for (int i = 0; i < 1000; ++i) {
                auto good = resolve_parameter<std::int32_t>("42");
                auto bad = resolve_parameter<std::int32_t>("9999999999999999999999");
                if (good && *good == 42 && !bad && bad.error().identifier() == "fwi") {
                    ++ok[t];
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (int count : ok) {
        REQUIRE(count == 1000);
    }
}
