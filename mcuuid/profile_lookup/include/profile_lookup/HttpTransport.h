#pragma once

#include "profile_lookup/ProfileServiceConfig.h"

#include <optional>
#include <string>

namespace mcuuid::profile_lookup {

struct HttpResponse {
    int status{0};
    std::string body;
};

// Issues a single blocking GET. Implementations hold no state between requests.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Returns std::nullopt if no response was received (connection failure, timeout, ...).
    virtual std::optional<HttpResponse> get(const std::string& path) = 0;
};

// IHttpTransport backed by cpp-httplib. A new client is opened for every request.
class HttplibTransport : public IHttpTransport {
public:
    explicit HttplibTransport(ProfileServiceConfig config);

    std::optional<HttpResponse> get(const std::string& path) override;

    const ProfileServiceConfig& config() const { return m_config; }

private:
    const ProfileServiceConfig m_config;
};

}  // namespace mcuuid::profile_lookup
