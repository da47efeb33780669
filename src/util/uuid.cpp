#include "paramroute/util/uuid.hpp"

#include <algorithm>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace paramroute {

namespace {

// Offsets of the hyphens in the 36-character canonical form.
constexpr std::array<std::size_t, 4> HYPHENS = {8, 13, 18, 23};
constexpr std::size_t CANONICAL_LENGTH = 36;

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_hyphen_position(std::size_t i) noexcept {
    return std::find(HYPHENS.begin(), HYPHENS.end(), i) != HYPHENS.end();
}

boost::uuids::uuid to_boost(const Uuid::Storage& bytes) noexcept {
    boost::uuids::uuid out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

} // anonymous namespace

std::optional<Uuid> Uuid::parse(std::string_view text) noexcept {
    if (text.size() != CANONICAL_LENGTH) {
        return std::nullopt;
    }

    Storage bytes{};
    std::size_t out = 0;
    int high = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_hyphen_position(i)) {
            if (c != '-') return std::nullopt;
            continue;
        }

        int nibble = hex_value(c);
        if (nibble < 0) return std::nullopt;

        if (high < 0) {
            high = nibble;
        } else {
            bytes[out++] = static_cast<std::uint8_t>((high << 4) | nibble);
            high = -1;
        }
    }

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::from_bytes(ByteView bytes) noexcept {
    if (bytes.size() != size) {
        return std::nullopt;
    }
    Storage storage{};
    std::copy(bytes.begin(), bytes.end(), storage.begin());
    return Uuid(storage);
}

Uuid Uuid::random() {
    // Version 4, RFC 4122 variant.
    static thread_local boost::uuids::random_generator generator;
    boost::uuids::uuid generated = generator();

    Storage storage{};
    std::copy(generated.begin(), generated.end(), storage.begin());
    return Uuid(storage);
}

bool Uuid::is_nil() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::string Uuid::to_string() const {
    return boost::uuids::to_string(to_boost(bytes_));
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.to_string();
}

} // namespace paramroute
