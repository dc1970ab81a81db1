#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace mcuuid::profile_lookup {

// Where and how to reach the username to profile lookup service.
struct ProfileServiceConfig {
    // Scheme, host and optional port, e.g. "https://api.mojang.com".
    std::string base_url{"https://api.mojang.com"};
    // Path the percent-encoded username is appended to.
    std::string profile_path{"/users/profiles/minecraft/"};

    std::chrono::seconds connection_timeout{20};
    std::chrono::seconds read_timeout{20};

    std::optional<std::string> proxy_host;
    int proxy_port{3128};
};

/**
 * @brief Overlays settings from the environment onto @p config.
 *
 *   mcuuid_api_url     - replaces base_url
 *   mcuuid_proxy       - HTTP proxy host
 *   mcuuid_proxy_port  - HTTP proxy port
 *
 * @throws std::invalid_argument if mcuuid_proxy_port is not a valid port number.
 */
ProfileServiceConfig load_service_config_from_env(ProfileServiceConfig config);

}  // namespace mcuuid::profile_lookup
