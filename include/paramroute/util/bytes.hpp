#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace paramroute {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

// ============================================================================
// LosslessBytes trait - Represent a value as bytes and rebuild it exactly
// ============================================================================
//
// Specializations provide:
//   static constexpr std::size_t fixed_size;       // 0 for variable length
//   static Bytes encode(const T& value);
//   static std::optional<T> decode(ByteView bytes);

template<typename T, typename = void>
struct LosslessBytes;

namespace detail {

template<typename U>
    requires std::is_unsigned_v<U>
Bytes encode_big_endian(U value) {
    Bytes out(sizeof(U));
    for (std::size_t i = sizeof(U); i-- > 0;) {
        out[i] = static_cast<std::uint8_t>(value & 0xFFu);
        if constexpr (sizeof(U) > 1) {
            value = static_cast<U>(value >> 8);
        } else {
            value = 0;
        }
    }
    return out;
}

template<typename U>
    requires std::is_unsigned_v<U>
std::optional<U> decode_big_endian(ByteView bytes) {
    if (bytes.size() != sizeof(U)) {
        return std::nullopt;
    }
    U value = 0;
    for (std::uint8_t b : bytes) {
        if constexpr (sizeof(U) > 1) {
            value = static_cast<U>((value << 8) | b);
        } else {
            value = b;
        }
    }
    return value;
}

} // namespace detail

// Integers: two's complement, big-endian, exactly sizeof(T) bytes.
template<typename T>
struct LosslessBytes<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr std::size_t fixed_size = sizeof(T);

    static Bytes encode(const T& value) {
        using U = std::make_unsigned_t<T>;
        return detail::encode_big_endian(static_cast<U>(value));
    }

    static std::optional<T> decode(ByteView bytes) {
        using U = std::make_unsigned_t<T>;
        auto raw = detail::decode_big_endian<U>(bytes);
        if (!raw) return std::nullopt;
        return static_cast<T>(*raw);
    }
};

// Floating point: IEEE-754 bit pattern, big-endian.
template<typename T>
struct LosslessBytes<T, std::enable_if_t<std::is_same_v<T, float> || std::is_same_v<T, double>>> {
    using Bits = std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>;
    static_assert(sizeof(Bits) == sizeof(T));

    static constexpr std::size_t fixed_size = sizeof(T);

    static Bytes encode(const T& value) {
        return detail::encode_big_endian(std::bit_cast<Bits>(value));
    }

    static std::optional<T> decode(ByteView bytes) {
        auto raw = detail::decode_big_endian<Bits>(bytes);
        if (!raw) return std::nullopt;
        return std::bit_cast<T>(*raw);
    }
};

template<>
struct LosslessBytes<std::string> {
    static constexpr std::size_t fixed_size = 0;

    static Bytes encode(const std::string& value) {
        return Bytes(value.begin(), value.end());
    }

    static std::optional<std::string> decode(ByteView bytes) {
        return std::string(bytes.begin(), bytes.end());
    }
};

template<typename T>
concept LosslessBytesConvertible = requires(const T& value, ByteView bytes) {
    { LosslessBytes<T>::fixed_size } -> std::convertible_to<std::size_t>;
    { LosslessBytes<T>::encode(value) } -> std::same_as<Bytes>;
    { LosslessBytes<T>::decode(bytes) } -> std::same_as<std::optional<T>>;
};

template<LosslessBytesConvertible T>
Bytes to_bytes(const T& value) {
    return LosslessBytes<T>::encode(value);
}

template<LosslessBytesConvertible T>
std::optional<T> from_bytes(ByteView bytes) {
    return LosslessBytes<T>::decode(bytes);
}

} // namespace paramroute
