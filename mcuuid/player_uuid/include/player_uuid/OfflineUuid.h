#pragma once

#include "utils/uuid_utils.h"

#include <string_view>

namespace mcuuid::player_uuid {

// Prefix prepended to the username before hashing.
constexpr std::string_view OFFLINE_PLAYER_PREFIX = "OfflinePlayer:";

/**
 * @brief Derives the identifier a server in offline mode assigns to a player.
 *
 * The identifier is the MD5 digest of "OfflinePlayer:" followed by the raw bytes of the
 * username, with the version set to 3 and the variant set to RFC 4122. The username is
 * used exactly as given (no case folding, trimming or validation), so this is defined
 * for every input including the empty string.
 *
 * Example:
 *   derive_offline_uuid("Notch").to_string() == "b50ad385-829d-3141-a216-7e7d7539ba7f"
 */
utils::Uuid derive_offline_uuid(std::string_view username);

}  // namespace mcuuid::player_uuid
