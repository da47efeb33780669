#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "paramroute/util/bytes.hpp"

namespace paramroute {

// ============================================================================
// Uuid - 128-bit identifier in RFC 4122 byte order
// ============================================================================

class Uuid {
public:
    static constexpr std::size_t size = 16;
    using Storage = std::array<std::uint8_t, size>;

private:
    Storage bytes_{};

public:
    constexpr Uuid() noexcept = default;
    constexpr explicit Uuid(const Storage& bytes) noexcept : bytes_(bytes) {}

    /// Parse the canonical textual form "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
    /// Hex digits may be upper or lower case; nothing else is accepted.
    static std::optional<Uuid> parse(std::string_view text) noexcept;

    /// Rebuild from exactly 16 bytes. Any other length yields nullopt.
    static std::optional<Uuid> from_bytes(ByteView bytes) noexcept;

    /// Version 4 (random) UUID.
    static Uuid random();

    static constexpr Uuid nil() noexcept { return Uuid{}; }

    const Storage& bytes() const noexcept { return bytes_; }

    bool is_nil() const noexcept;

    // Value of the version nibble (4 for random UUIDs).
    int version() const noexcept { return bytes_[6] >> 4; }

    // Lowercase canonical form.
    std::string to_string() const;

    friend constexpr bool operator==(const Uuid&, const Uuid&) noexcept = default;
    friend constexpr auto operator<=>(const Uuid&, const Uuid&) noexcept = default;
};

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

template<>
struct LosslessBytes<Uuid> {
    static constexpr std::size_t fixed_size = Uuid::size;

    static Bytes encode(const Uuid& value) {
        return Bytes(value.bytes().begin(), value.bytes().end());
    }

    static std::optional<Uuid> decode(ByteView bytes) {
        return Uuid::from_bytes(bytes);
    }
};

} // namespace paramroute

template<>
struct std::hash<paramroute::Uuid> {
    std::size_t operator()(const paramroute::Uuid& uuid) const noexcept {
        // FNV-1a over the 16 bytes
        std::uint64_t h = 14695981039346656037ull;
        for (auto b : uuid.bytes()) {
            h ^= b;
            h *= 1099511628211ull;
        }
        return static_cast<std::size_t>(h);
    }
};
