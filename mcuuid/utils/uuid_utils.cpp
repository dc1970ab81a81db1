#include "uuid_utils.h"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace mcuuid::utils {

namespace {

// Byte indices after which a hyphen appears in the canonical form.
bool is_group_end(std::size_t byte_index) {
    return byte_index == 3 || byte_index == 5 || byte_index == 7 || byte_index == 9;
}

bool is_hyphen_offset(std::size_t offset) {
    return offset == 8 || offset == 13 || offset == 18 || offset == 23;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Converts exactly 32 hex digits into bytes. Returns false on a non-hex character.
bool decode_hex(std::string_view hex, UuidBytes& out) {
    for (std::size_t i = 0; i < out.size(); ++i) {
        const int high = hex_value(hex[2 * i]);
        const int low = hex_value(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        out[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return true;
}

std::string format_uuid(const UuidBytes& bytes, bool hyphenate) {
    std::stringstream ss;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
        if (hyphenate && is_group_end(i)) {
            ss << "-";
        }
    }
    return ss.str();
}

}  // namespace

std::string Uuid::to_string() const { return format_uuid(m_bytes, true); }

std::string Uuid::to_hex_string() const { return format_uuid(m_bytes, false); }

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) { return os << uuid.to_string(); }

std::optional<Uuid> try_parse_uuid(std::string_view text) {
    std::string hex;
    if (text.size() == UUID_HEX_LENGTH) {
        hex = std::string(text);
    } else if (text.size() == UUID_CANONICAL_LENGTH) {
        hex.reserve(UUID_HEX_LENGTH);
        for (std::size_t offset = 0; offset < text.size(); ++offset) {
            const bool is_hyphen = text[offset] == '-';
            if (is_hyphen != is_hyphen_offset(offset)) {
                return std::nullopt;
            }
            if (!is_hyphen) {
                hex.push_back(text[offset]);
            }
        }
    } else {
        return std::nullopt;
    }

    UuidBytes bytes{};
    if (!decode_hex(hex, bytes)) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

Uuid parse_uuid(std::string_view text) {
    auto uuid = try_parse_uuid(text);
    if (!uuid) {
        throw UuidParseError("Invalid uuid '" + std::string(text) +
                             "': expected 32 hex digits, optionally grouped 8-4-4-4-12");
    }
    return *uuid;
}

void apply_version_and_variant(UuidBytes& bytes, std::uint8_t version) {
    // Set the UUID version
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | ((version & 0x0F) << 4));

    // Set the UUID variant to the RFC 4122 specified value (10)
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
}

}  // namespace mcuuid::utils
