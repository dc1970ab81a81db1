#include "cli/cli.h"
#include "cli/cli_utils.h"
#include "mcuuid_version.h"
#include "player_uuid/PlayerUuid.h"
#include "profile_lookup/OnlineResolver.h"
#include "profile_lookup/ProfileServiceConfig.h"

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace mcuuid {

int online(int argc, char* argv[]) {
    argparse::ArgumentParser parser("mcuuid online", MCUUID_VERSION,
                                    argparse::default_arguments::help);
    parser.add_description(
            "Look up the identifiers the authentication service assigned to players. "
            "One request is made per name and failed lookups are not retried.");

    parser.add_argument("usernames")
            .nargs(argparse::nargs_pattern::at_least_one)
            .help("player names to look up");
    parser.add_argument("--api-url")
            .default_value(std::string())
            .help("base url of the lookup service, overrides $mcuuid_api_url");
    parser.add_argument("--timeout")
            .default_value(0)
            .scan<'i', int>()
            .help("connection and read timeout in seconds (default 20)");
    cli::add_output_arguments(parser);

    int verbosity = 0;
    cli::add_verbose_argument(parser, verbosity);

    if (!cli::parse_args(parser, argc, argv)) {
        return EXIT_FAILURE;
    }
    cli::apply_verbosity(parser, verbosity);

    profile_lookup::ProfileServiceConfig config;
    try {
        config = profile_lookup::load_service_config_from_env(config);
    } catch (const std::exception& e) {
        spdlog::error(e.what());
        return EXIT_FAILURE;
    }

    const auto api_url = parser.get<std::string>("--api-url");
    if (!api_url.empty()) {
        config.base_url = api_url;
    }

    const auto timeout = parser.get<int>("--timeout");
    if (timeout < 0) {
        spdlog::error("--timeout must not be negative");
        return EXIT_FAILURE;
    }
    if (timeout > 0) {
        config.connection_timeout = std::chrono::seconds(timeout);
        config.read_timeout = std::chrono::seconds(timeout);
    }

    const profile_lookup::OnlineResolver resolver(config);
    const auto options = cli::get_output_options(parser);

    int exit_code = EXIT_SUCCESS;
    for (const auto& username : parser.get<std::vector<std::string>>("usernames")) {
        const auto result = resolver.resolve(username);
        if (const auto* error = std::get_if<profile_lookup::LookupError>(&result)) {
            spdlog::error("Failed to look up '{}': {}", username,
                          profile_lookup::to_string(*error));
            exit_code = EXIT_FAILURE;
            continue;
        }

        const player_uuid::PlayerUuid player(std::get<utils::Uuid>(result),
                                             player_uuid::Provenance::Online);
        std::cout << cli::format_line(options, username, player.uuid()) << '\n';
    }

    return exit_code;
}

}  // namespace mcuuid
