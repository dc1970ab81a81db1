#include "profile_lookup/HttpTransport.h"
#include "profile_lookup/OnlineResolver.h"
#include "profile_lookup/ProfileServiceConfig.h"

#include <catch2/catch_test_macros.hpp>

#ifndef _WIN32
#include <sys/socket.h>
#endif

#ifdef MSG_NOSIGNAL
#define CPPHTTPLIB_SEND_FLAGS MSG_NOSIGNAL
#endif
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

#define CUT_TAG "[mcuuid::profile_lookup::HttplibTransport]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

using namespace mcuuid::profile_lookup;
using mcuuid::utils::Uuid;

namespace {

// A stand-in for the profile lookup service listening on the loopback interface.
class LoopbackProfileServer {
public:
    LoopbackProfileServer() {
        m_server.Get(R"(/users/profiles/minecraft/(.+))",
                     [](const httplib::Request& req, httplib::Response& res) {
                         const std::string name = req.matches[1];
                         if (name == "Notch") {
                             res.set_content(
                                     R"({"id":"069a79f444e94726a5befca90e38aaf5","name":"Notch"})",
                                     "application/json");
                         } else if (name == "broken") {
                             res.set_content(R"({"name":"broken"})", "application/json");
                         } else if (name == "overloaded") {
                             res.status = 503;
                         } else if (name.find(' ') != std::string::npos) {
                             res.status = 400;
                         } else {
                             res.status = 404;
                         }
                     });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        if (m_port <= 0) {
            throw std::runtime_error("Failed to bind loopback server");
        }
        m_thread = std::thread([this] { m_server.listen_after_bind(); });
        m_server.wait_until_ready();
    }

    ~LoopbackProfileServer() {
        m_server.stop();
        m_thread.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(m_port); }

private:
    httplib::Server m_server;
    int m_port{0};
    std::thread m_thread;
};

ProfileServiceConfig loopback_config(const std::string& url) {
    ProfileServiceConfig config;
    config.base_url = url;
    config.connection_timeout = std::chrono::seconds(5);
    config.read_timeout = std::chrono::seconds(5);
    return config;
}

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : m_name(name) {
        if (const char* previous = std::getenv(name)) {
            m_previous = previous;
        }
        setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (m_previous) {
            setenv(m_name, m_previous->c_str(), 1);
        } else {
            unsetenv(m_name);
        }
    }

private:
    const char* m_name;
    std::optional<std::string> m_previous;
};

}  // namespace

DEFINE_TEST("transport returns the status and body") {
    LoopbackProfileServer server;
    HttplibTransport transport(loopback_config(server.url()));

    const auto found = transport.get("/users/profiles/minecraft/Notch");
    CATCH_REQUIRE(found.has_value());
    CATCH_CHECK(found->status == 200);
    CATCH_CHECK(found->body.find("069a79f444e94726a5befca90e38aaf5") != std::string::npos);

    const auto missing = transport.get("/users/profiles/minecraft/nobody");
    CATCH_REQUIRE(missing.has_value());
    CATCH_CHECK(missing->status == 404);
}

DEFINE_TEST("resolver maps loopback responses") {
    LoopbackProfileServer server;
    const OnlineResolver resolver(loopback_config(server.url()));

    const auto notch = resolver.resolve("Notch");
    CATCH_REQUIRE(std::holds_alternative<Uuid>(notch));
    CATCH_CHECK(std::get<Uuid>(notch).to_string() == "069a79f4-44e9-4726-a5be-fca90e38aaf5");

    CATCH_CHECK(std::get<LookupError>(resolver.resolve("nobody")) == LookupError::NotFound);
    CATCH_CHECK(std::get<LookupError>(resolver.resolve("has space")) == LookupError::NotFound);
    CATCH_CHECK(std::get<LookupError>(resolver.resolve("broken")) == LookupError::Malformed);
    CATCH_CHECK(std::get<LookupError>(resolver.resolve("overloaded")) == LookupError::Transport);
}

DEFINE_TEST("nothing listening is a Transport error") {
    std::string url;
    {
        // Grab a free port, then close it again.
        LoopbackProfileServer server;
        url = server.url();
    }
    const OnlineResolver resolver(loopback_config(url));

    CATCH_CHECK(std::get<LookupError>(resolver.resolve("Notch")) == LookupError::Transport);
}

DEFINE_TEST("configuration is read from the environment") {
    CATCH_SECTION("defaults") {
        const ProfileServiceConfig config;
        CATCH_CHECK(config.base_url == "https://api.mojang.com");
        CATCH_CHECK(config.profile_path == "/users/profiles/minecraft/");
        CATCH_CHECK(config.connection_timeout == std::chrono::seconds(20));
        CATCH_CHECK_FALSE(config.proxy_host.has_value());
    }

    CATCH_SECTION("overrides") {
        ScopedEnv api_url("mcuuid_api_url", "http://localhost:8080");
        ScopedEnv proxy("mcuuid_proxy", "proxy.example.com");
        ScopedEnv proxy_port("mcuuid_proxy_port", "8888");

        const auto config = load_service_config_from_env(ProfileServiceConfig{});
        CATCH_CHECK(config.base_url == "http://localhost:8080");
        CATCH_CHECK(config.proxy_host == std::optional<std::string>("proxy.example.com"));
        CATCH_CHECK(config.proxy_port == 8888);
        CATCH_CHECK(config.profile_path == "/users/profiles/minecraft/");
    }

    CATCH_SECTION("invalid proxy port") {
        ScopedEnv proxy_port("mcuuid_proxy_port", "http");
        CATCH_CHECK_THROWS_AS(load_service_config_from_env(ProfileServiceConfig{}),
                              std::invalid_argument);
    }
}
