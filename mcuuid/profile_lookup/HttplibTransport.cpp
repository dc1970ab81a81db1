#include "profile_lookup/HttpTransport.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>

#ifndef _WIN32
// Required for MSG_NOSIGNAL and SO_NOSIGPIPE
#include <sys/socket.h>
#include <sys/types.h>
#endif

#ifdef MSG_NOSIGNAL
#define CPPHTTPLIB_SEND_FLAGS MSG_NOSIGNAL
#endif
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

namespace fs = std::filesystem;

namespace mcuuid::profile_lookup {

namespace {

// Returns the CA bundle to use when OpenSSL's default location is known to be wrong.
std::optional<std::string> find_ssl_cert_file() {
#ifndef _WIN32
    // Allow the user to override this.
    if (const char* ssl_cert_file = getenv("SSL_CERT_FILE")) {
        return std::string(ssl_cert_file);
    }

#ifdef __linux__
    // Distributions other than Debian derivatives may not keep certs where OpenSSL expects.
    if (fs::exists("/etc/os-release")) {
        std::ifstream os_release("/etc/os-release");
        std::string line;
        while (std::getline(os_release, line)) {
            if (line.rfind("ID=", 0) == 0) {
                if (line.find("centos") != line.npos || line.find("rhel") != line.npos ||
                    line.find("fedora") != line.npos) {
                    return std::string("/etc/ssl/certs/ca-bundle.crt");
                }
                break;
            }
        }
    }
#elif defined(__APPLE__)
    // macOS provides certs at the following location regardless of how OpenSSL was built.
    return std::string("/etc/ssl/cert.pem");
#endif
#endif  // _WIN32
    return std::nullopt;
}

std::unique_ptr<httplib::Client> create_client(const ProfileServiceConfig& config) {
    auto http = std::make_unique<httplib::Client>(config.base_url);
    http->set_follow_location(true);
    http->set_connection_timeout(config.connection_timeout);
    http->set_read_timeout(config.read_timeout);

    if (const auto ssl_cert_file = find_ssl_cert_file()) {
        spdlog::trace("using CA bundle: {}", *ssl_cert_file);
        http->set_ca_cert_path(*ssl_cert_file);
    }

    if (config.proxy_host) {
        spdlog::debug("using proxy: {}:{}", *config.proxy_host, config.proxy_port);
        http->set_proxy(*config.proxy_host, config.proxy_port);
    }

    http->set_socket_options([](socket_t sock) {
#ifdef __APPLE__
        // Disable SIGPIPE signal generation since it takes down the entire process
        // whereas we can more gracefully handle the EPIPE error.
        int enabled = 1;
        setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, reinterpret_cast<char*>(&enabled),
                   sizeof(enabled));
#else
        (void)sock;
#endif
    });

    return http;
}

}  // namespace

HttplibTransport::HttplibTransport(ProfileServiceConfig config) : m_config(std::move(config)) {}

std::optional<HttpResponse> HttplibTransport::get(const std::string& path) {
    auto client = create_client(m_config);
    if (!client->is_valid()) {
        spdlog::error("Invalid lookup service url: '{}'", m_config.base_url);
        return std::nullopt;
    }

    spdlog::trace("GET {}{}", m_config.base_url, path);
    httplib::Result res = client->Get(path);
    if (!res) {
        spdlog::error("Request to {} failed: {}", m_config.base_url,
                      httplib::to_string(res.error()));
        return std::nullopt;
    }

    spdlog::trace("{} responded with status {}", m_config.base_url, res->status);
    return HttpResponse{res->status, std::move(res->body)};
}

}  // namespace mcuuid::profile_lookup
