#pragma once

#include <array>
#include <string_view>

namespace mcuuid::utils::crypto {

using MD5Digest = std::array<unsigned char, 16>;
MD5Digest md5(std::string_view data);

}  // namespace mcuuid::utils::crypto
