#include "profile_lookup/ProfileServiceConfig.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace mcuuid::profile_lookup {

namespace {

int parse_port(const std::string& value) {
    std::size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || port <= 0 || port > 65535) {
        throw std::invalid_argument("Invalid mcuuid_proxy_port: '" + value + "'");
    }
    return port;
}

}  // namespace

ProfileServiceConfig load_service_config_from_env(ProfileServiceConfig config) {
    if (const char* api_url = std::getenv("mcuuid_api_url")) {
        spdlog::debug("using lookup service from environment: {}", api_url);
        config.base_url = api_url;
    }

    if (const char* proxy_url = std::getenv("mcuuid_proxy")) {
        config.proxy_host = proxy_url;
    }

    if (const char* ps = std::getenv("mcuuid_proxy_port")) {
        config.proxy_port = parse_port(ps);
    }

    return config;
}

}  // namespace mcuuid::profile_lookup
