#include "player_uuid/PlayerUuid.h"

#include "player_uuid/OfflineUuid.h"

#include <ostream>
#include <stdexcept>
#include <tuple>

namespace mcuuid::player_uuid {

namespace {
constexpr int ONLINE_UUID_VERSION = 4;
constexpr int OFFLINE_UUID_VERSION = 3;
}  // namespace

std::string to_string(Provenance provenance) {
    switch (provenance) {
    case Provenance::Offline:
        return "offline";
    case Provenance::Online:
        return "online";
    }
    throw std::logic_error("Unknown provenance");
}

PlayerUuid PlayerUuid::from_offline_username(std::string_view username) {
    return PlayerUuid(derive_offline_uuid(username), Provenance::Offline);
}

PlayerUuid PlayerUuid::from_uuid(const utils::Uuid& uuid) {
    switch (uuid.version()) {
    case ONLINE_UUID_VERSION:
        return PlayerUuid(uuid, Provenance::Online);
    case OFFLINE_UUID_VERSION:
        return PlayerUuid(uuid, Provenance::Offline);
    default:
        throw std::invalid_argument("Not a player uuid: " + uuid.to_string() + " has version " +
                                    std::to_string(uuid.version()));
    }
}

bool PlayerUuid::operator<(const PlayerUuid& other) const {
    return std::tie(m_provenance, m_uuid) < std::tie(other.m_provenance, other.m_uuid);
}

std::ostream& operator<<(std::ostream& os, const PlayerUuid& player) {
    return os << player.to_canonical_string() << " (" << to_string(player.provenance()) << ")";
}

}  // namespace mcuuid::player_uuid
