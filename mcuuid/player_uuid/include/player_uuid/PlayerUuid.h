#pragma once

#include "utils/uuid_utils.h"

#include <iosfwd>
#include <string>
#include <string_view>

namespace mcuuid::player_uuid {

// Where a player identifier came from.
enum class Provenance {
    Offline,  // Derived locally from the username.
    Online,   // Assigned by the authentication service.
};

std::string to_string(Provenance provenance);

// An identifier tagged with its provenance. Immutable once constructed.
class PlayerUuid {
public:
    PlayerUuid(const utils::Uuid& uuid, Provenance provenance)
            : m_uuid(uuid), m_provenance(provenance) {}

    // The identifier an offline-mode server assigns to |username|.
    static PlayerUuid from_offline_username(std::string_view username);

    /**
     * @brief Wraps an existing identifier, inferring its provenance from the version field.
     *
     * Version 4 (random) identifiers are issued by the authentication service, version 3
     * (name based) identifiers are offline ones.
     *
     * @throws std::invalid_argument for any other version.
     */
    static PlayerUuid from_uuid(const utils::Uuid& uuid);

    const utils::Uuid& uuid() const { return m_uuid; }
    const utils::UuidBytes& as_bytes() const { return m_uuid.bytes(); }
    std::string to_canonical_string() const { return m_uuid.to_string(); }

    Provenance provenance() const { return m_provenance; }
    bool is_offline() const { return m_provenance == Provenance::Offline; }
    bool is_online() const { return m_provenance == Provenance::Online; }

    bool operator==(const PlayerUuid& other) const {
        return m_provenance == other.m_provenance && m_uuid == other.m_uuid;
    }
    bool operator!=(const PlayerUuid& other) const { return !(*this == other); }
    bool operator<(const PlayerUuid& other) const;

private:
    utils::Uuid m_uuid;
    Provenance m_provenance;
};

std::ostream& operator<<(std::ostream& os, const PlayerUuid& player);

}  // namespace mcuuid::player_uuid
