#include "player_uuid/OfflineUuid.h"

#include "utils/crypto_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace mcuuid::player_uuid {

utils::Uuid derive_offline_uuid(std::string_view username) {
    std::string name(OFFLINE_PLAYER_PREFIX);
    name.append(username.data(), username.size());

    const auto hash = utils::crypto::md5(name);

    utils::UuidBytes bytes;
    std::copy(std::begin(hash), std::end(hash), std::begin(bytes));

    // Name based, MD5 hashed.
    utils::apply_version_and_variant(bytes, 3);

    utils::Uuid uuid(bytes);
    spdlog::trace("Derived offline uuid {} for '{}'", uuid.to_string(), username);
    return uuid;
}

}  // namespace mcuuid::player_uuid
