#include "profile_lookup/OnlineResolver.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace mcuuid::profile_lookup {

namespace {

namespace status {
constexpr int OK = 200;
// Older deployments answer an unknown name with an empty 204, newer ones with 404.
constexpr int NO_CONTENT = 204;
constexpr int NOT_FOUND = 404;
// Names that can't exist (too long, illegal characters) are rejected up front.
constexpr int BAD_REQUEST = 400;
}  // namespace status

bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

LookupResult parse_profile(std::string_view username, const std::string& body) {
    const auto profile = nlohmann::json::parse(body, nullptr, false);
    if (profile.is_discarded() || !profile.is_object()) {
        spdlog::error("Lookup of '{}' returned a body that is not a JSON object", username);
        return LookupError::Malformed;
    }

    const auto id = profile.find("id");
    if (id == profile.end() || !id->is_string()) {
        spdlog::error("Lookup of '{}' returned a profile without an id", username);
        return LookupError::Malformed;
    }

    const auto uuid = utils::try_parse_uuid(id->get<std::string>());
    if (!uuid) {
        spdlog::error("Lookup of '{}' returned an invalid id: '{}'", username,
                      id->get<std::string>());
        return LookupError::Malformed;
    }

    const auto name = profile.find("name");
    if (name != profile.end() && name->is_string()) {
        spdlog::debug("Resolved '{}' to {} ({})", username, uuid->to_string(),
                      name->get<std::string>());
    } else {
        spdlog::debug("Resolved '{}' to {}", username, uuid->to_string());
    }
    return *uuid;
}

}  // namespace

std::string to_string(LookupError error) {
    switch (error) {
    case LookupError::NotFound:
        return "not found";
    case LookupError::Transport:
        return "transport error";
    case LookupError::Malformed:
        return "malformed response";
    }
    throw std::logic_error("Unknown lookup error");
}

std::string encode_path_segment(std::string_view segment) {
    constexpr char HEX_DIGITS[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(segment.size());
    for (char ch : segment) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded.push_back(ch);
        } else {
            encoded.push_back('%');
            encoded.push_back(HEX_DIGITS[c >> 4]);
            encoded.push_back(HEX_DIGITS[c & 0x0F]);
        }
    }
    return encoded;
}

OnlineResolver::OnlineResolver(std::unique_ptr<IHttpTransport> transport, std::string profile_path)
        : m_transport(std::move(transport)), m_profile_path(std::move(profile_path)) {
    if (!m_transport) {
        throw std::invalid_argument("OnlineResolver requires a transport");
    }
}

OnlineResolver::OnlineResolver(const ProfileServiceConfig& config)
        : OnlineResolver(std::make_unique<HttplibTransport>(config), config.profile_path) {}

LookupResult OnlineResolver::resolve(std::string_view username) const {
    const auto response = m_transport->get(m_profile_path + encode_path_segment(username));
    if (!response) {
        return LookupError::Transport;
    }

    switch (response->status) {
    case status::OK:
        return parse_profile(username, response->body);
    case status::NO_CONTENT:
    case status::NOT_FOUND:
    case status::BAD_REQUEST:
        spdlog::debug("No profile named '{}' (status {})", username, response->status);
        return LookupError::NotFound;
    default:
        spdlog::error("Lookup of '{}' failed with status {}", username, response->status);
        return LookupError::Transport;
    }
}

}  // namespace mcuuid::profile_lookup
