#pragma once

#include "profile_lookup/HttpTransport.h"
#include "utils/uuid_utils.h"

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace mcuuid::profile_lookup {

enum class LookupError {
    // The service has no profile with that name.
    NotFound,
    // No response, or a status the service does not use for lookups. Usually transient.
    Transport,
    // A successful response that doesn't carry a usable identifier.
    Malformed,
};

std::string to_string(LookupError error);

using LookupResult = std::variant<utils::Uuid, LookupError>;

/**
 * @brief Resolves usernames to the identifiers assigned by the authentication service.
 *
 * Each call to resolve() issues exactly one request through the transport and blocks until
 * it completes. Nothing is cached and failed requests are not retried.
 */
class OnlineResolver {
public:
    explicit OnlineResolver(std::unique_ptr<IHttpTransport> transport,
                            std::string profile_path = ProfileServiceConfig{}.profile_path);

    // Resolver talking to the service described by |config| over HTTP(S).
    explicit OnlineResolver(const ProfileServiceConfig& config);

    LookupResult resolve(std::string_view username) const;

private:
    std::unique_ptr<IHttpTransport> m_transport;
    const std::string m_profile_path;
};

// Percent-encodes every byte outside the RFC 3986 unreserved set.
std::string encode_path_segment(std::string_view segment);

}  // namespace mcuuid::profile_lookup
