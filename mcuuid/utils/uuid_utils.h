#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mcuuid::utils {

using UuidBytes = std::array<std::uint8_t, 16>;

// Length of the bare (no separators) and canonical (8-4-4-4-12) text forms.
constexpr std::size_t UUID_HEX_LENGTH = 32;
constexpr std::size_t UUID_CANONICAL_LENGTH = 36;

class UuidParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A 128-bit identifier. The default-constructed value is the nil identifier.
class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const UuidBytes& bytes) : m_bytes(bytes) {}

    const UuidBytes& bytes() const { return m_bytes; }

    // The high nibble of byte 6.
    int version() const { return m_bytes[6] >> 4; }

    // True if the two high bits of byte 8 are 10.
    bool is_rfc4122_variant() const { return (m_bytes[8] & 0xC0) == 0x80; }

    bool is_nil() const { return m_bytes == UuidBytes{}; }

    // Lowercase hex grouped 8-4-4-4-12, e.g. "069a79f4-44e9-4726-a5be-fca90e38aaf5".
    std::string to_string() const;

    // Lowercase hex without separators, e.g. "069a79f444e94726a5befca90e38aaf5".
    std::string to_hex_string() const;

    bool operator==(const Uuid& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const Uuid& other) const { return m_bytes != other.m_bytes; }
    bool operator<(const Uuid& other) const { return m_bytes < other.m_bytes; }

private:
    UuidBytes m_bytes{};
};

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

/**
 * @brief Parses an identifier from its text form.
 *
 * Two shapes are accepted: 32 hex digits with no separators (the form returned by the
 * profile lookup service), or the canonical 36 character form with hyphens at offsets
 * 8, 13, 18 and 23. Hex digits may be upper or lower case.
 *
 * @throws UuidParseError if the text has any other shape.
 */
Uuid parse_uuid(std::string_view text);

// As parse_uuid(), but returns std::nullopt instead of throwing.
std::optional<Uuid> try_parse_uuid(std::string_view text);

/**
 * @brief Sets the version and variant fields of a 16 byte identifier in place.
 *
 * The high nibble of byte 6 is replaced with @p version and the two high bits of byte 8
 * are set to the RFC 4122 variant (10). No other bits are modified.
 */
void apply_version_and_variant(UuidBytes& bytes, std::uint8_t version);

}  // namespace mcuuid::utils

namespace std {
template <>
struct hash<mcuuid::utils::Uuid> {
    std::size_t operator()(const mcuuid::utils::Uuid& uuid) const noexcept {
        std::size_t seed = 0;
        for (auto byte : uuid.bytes()) {
            seed ^= std::hash<std::uint8_t>{}(byte) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
}  // namespace std
