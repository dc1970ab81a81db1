#pragma once

#include "utils/log_utils.h"
#include "utils/uuid_utils.h"

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <sstream>
#include <string>

namespace mcuuid::cli {

struct OutputOptions {
    bool bare{false};
    bool names{false};
};

inline void add_output_arguments(argparse::ArgumentParser& parser) {
    parser.add_argument("--bare")
            .default_value(false)
            .implicit_value(true)
            .help("print identifiers as 32 hex digits without hyphens");
    parser.add_argument("--names")
            .default_value(false)
            .implicit_value(true)
            .help("prefix each identifier with its input and a tab");
}

inline OutputOptions get_output_options(const argparse::ArgumentParser& parser) {
    return {parser.get<bool>("--bare"), parser.get<bool>("--names")};
}

// Adds a repeatable -v/--verbose flag which increments |verbosity|.
inline void add_verbose_argument(argparse::ArgumentParser& parser, int& verbosity) {
    parser.add_argument("-v", "--verbose")
            .default_value(false)
            .implicit_value(true)
            .nargs(0)
            .action([&](const auto&) { ++verbosity; })
            .append();
}

// Parses the arguments, reporting failures with the usage text. Returns false on failure.
inline bool parse_args(argparse::ArgumentParser& parser, int argc, char* argv[]) {
    try {
        parser.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::ostringstream parser_stream;
        parser_stream << parser;
        spdlog::error("{}\n{}", e.what(), parser_stream.str());
        return false;
    }
    return true;
}

inline void apply_verbosity(const argparse::ArgumentParser& parser, int verbosity) {
    if (parser.get<bool>("--verbose")) {
        utils::SetVerboseLogging(static_cast<utils::VerboseLogLevel>(verbosity));
    }
}

inline std::string format_line(const OutputOptions& options,
                               const std::string& input,
                               const utils::Uuid& uuid) {
    std::string line = options.bare ? uuid.to_hex_string() : uuid.to_string();
    if (options.names) {
        line = input + '\t' + line;
    }
    return line;
}

}  // namespace mcuuid::cli
