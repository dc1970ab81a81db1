#include "cli/cli.h"
#include "cli/cli_utils.h"
#include "mcuuid_version.h"
#include "player_uuid/PlayerUuid.h"

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace mcuuid {

int offline(int argc, char* argv[]) {
    argparse::ArgumentParser parser("mcuuid offline", MCUUID_VERSION,
                                    argparse::default_arguments::help);
    parser.add_description("Derive the identifiers an offline-mode server assigns to players.");

    parser.add_argument("usernames")
            .nargs(argparse::nargs_pattern::at_least_one)
            .help("player names, used exactly as given");
    cli::add_output_arguments(parser);

    int verbosity = 0;
    cli::add_verbose_argument(parser, verbosity);

    if (!cli::parse_args(parser, argc, argv)) {
        return EXIT_FAILURE;
    }
    cli::apply_verbosity(parser, verbosity);

    const auto options = cli::get_output_options(parser);
    for (const auto& username : parser.get<std::vector<std::string>>("usernames")) {
        const auto player = player_uuid::PlayerUuid::from_offline_username(username);
        std::cout << cli::format_line(options, username, player.uuid()) << '\n';
    }

    return EXIT_SUCCESS;
}

}  // namespace mcuuid
