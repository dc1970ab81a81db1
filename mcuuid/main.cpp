#include "cli/cli.h"
#include "mcuuid_version.h"
#include "utils/log_utils.h"
#include "utils/string_utils.h"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using entry_ptr = int (*)(int, char**);

namespace {

void usage(const std::vector<std::string>& commands) {
    std::cerr << "Usage: mcuuid [options] subcommand\n\n"
              << "Positional arguments:\n";

    for (const auto& command : commands) {
        std::cerr << command << '\n';
    }

    std::cerr << "\nOptional arguments:\n"
              << "-h --help               shows help message and exits\n"
              << "-v --version            prints version information and exits\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    // Load logging settings from environment/command-line.
    spdlog::cfg::load_env_levels();
    mcuuid::utils::InitLogging();

    const std::map<std::string, entry_ptr> subcommands = {
            {"offline", &mcuuid::offline},
            {"online", &mcuuid::online},
            {"inspect", &mcuuid::inspect},
    };

    std::vector<std::string> arguments(argv + 1, argv + argc);
    std::vector<std::string> keys;

    keys.reserve(subcommands.size());
    for (const auto& [key, _] : subcommands) {
        keys.push_back(key);
    }

    if (arguments.size() == 0) {
        usage(keys);
        return EXIT_SUCCESS;
    }

    spdlog::debug("Running: \"{}\"", mcuuid::utils::join(arguments, "\" \""));

    const auto& subcommand = arguments[0];

    if (subcommand == "-v" || subcommand == "--version") {
        std::cerr << MCUUID_VERSION << '\n';
    } else if (subcommand == "-h" || subcommand == "--help") {
        usage(keys);
        return EXIT_SUCCESS;
    } else if (subcommands.find(subcommand) != subcommands.end()) {
        return subcommands.at(subcommand)(--argc, ++argv);
    } else {
        usage(keys);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
