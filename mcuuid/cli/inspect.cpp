#include "cli/cli.h"
#include "cli/cli_utils.h"
#include "mcuuid_version.h"
#include "player_uuid/PlayerUuid.h"

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace mcuuid {

int inspect(int argc, char* argv[]) {
    argparse::ArgumentParser parser("mcuuid inspect", MCUUID_VERSION,
                                    argparse::default_arguments::help);
    parser.add_description(
            "Normalise player identifiers and report whether they are online or offline ones.");

    parser.add_argument("uuids")
            .nargs(argparse::nargs_pattern::at_least_one)
            .help("identifiers, either 32 hex digits or hyphenated 8-4-4-4-12");
    cli::add_output_arguments(parser);

    int verbosity = 0;
    cli::add_verbose_argument(parser, verbosity);

    if (!cli::parse_args(parser, argc, argv)) {
        return EXIT_FAILURE;
    }
    cli::apply_verbosity(parser, verbosity);

    const auto options = cli::get_output_options(parser);

    int exit_code = EXIT_SUCCESS;
    for (const auto& text : parser.get<std::vector<std::string>>("uuids")) {
        try {
            const auto player = player_uuid::PlayerUuid::from_uuid(utils::parse_uuid(text));
            std::cout << cli::format_line(options, text, player.uuid()) << '\t'
                      << player_uuid::to_string(player.provenance()) << '\n';
        } catch (const std::exception& e) {
            spdlog::error(e.what());
            exit_code = EXIT_FAILURE;
        }
    }

    return exit_code;
}

}  // namespace mcuuid
