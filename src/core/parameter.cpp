#include "paramroute/core/parameter.hpp"

#include <cctype>
#include <limits>
#include <system_error>

namespace paramroute::detail {

namespace {

bool is_hex_prefix(std::string_view s) noexcept {
    return s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

// Order of magnitude of an unsigned literal that from_chars rejected as
// out of range: positive when it overflowed, otherwise it underflowed.
// Hex literals count four bits per digit and use a binary exponent.
long long literal_magnitude(std::string_view s, bool hex) noexcept {
    auto is_digit = [hex](char c) {
        auto u = static_cast<unsigned char>(c);
        return hex ? std::isxdigit(u) != 0 : std::isdigit(u) != 0;
    };

    long long integer_digits = 0;
    long long fraction_zeros = 0;
    bool seen_nonzero = false;
    bool in_fraction = false;

    std::size_t i = 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c == '.') {
            in_fraction = true;
        } else if (!is_digit(c)) {
            break;
        } else if (!in_fraction) {
            if (seen_nonzero || c != '0') {
                seen_nonzero = true;
                ++integer_digits;
            }
        } else if (!seen_nonzero) {
            if (c == '0') {
                ++fraction_zeros;
            } else {
                seen_nonzero = true;
            }
        }
    }

    long long magnitude = integer_digits > 0 ? integer_digits : -fraction_zeros;
    if (hex) magnitude *= 4;

    // s[i] is the exponent marker, if any.
    long long exponent = 0;
    if (i < s.size()) {
        std::string_view rest = s.substr(i + 1);
        bool negative = false;
        if (!rest.empty() && (rest.front() == '+' || rest.front() == '-')) {
            negative = rest.front() == '-';
            rest.remove_prefix(1);
        }
        for (char c : rest) {
            if (exponent < 1'000'000'000) exponent = exponent * 10 + (c - '0');
        }
        if (negative) exponent = -exponent;
    }

    return magnitude + exponent;
}

} // anonymous namespace

std::optional<double> parse_double(std::string_view s) {
    // Locale independent: the decimal separator is always '.'.
    if (s.empty()) return std::nullopt;

    bool negative = false;
    if (s.front() == '+' || s.front() == '-') {
        negative = s.front() == '-';
        s.remove_prefix(1);
        if (s.empty() || s.front() == '+' || s.front() == '-') return std::nullopt;
    }

    bool hex = is_hex_prefix(s);
    if (hex) {
        s.remove_prefix(2);
        if (s.front() == '+' || s.front() == '-') return std::nullopt;
    }

    double value = 0.0;
    auto fmt = hex ? std::chars_format::hex : std::chars_format::general;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, fmt);

    if (ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        // Saturate: huge magnitudes become inf, tiny ones 0.
        value = literal_magnitude(s, hex) > 0 ? std::numeric_limits<double>::infinity() : 0.0;
    } else if (ec != std::errc{}) {
        return std::nullopt;
    }

    return negative ? -value : value;
}

} // namespace paramroute::detail
