#pragma once

#include "runmap/buildmap/build.h"
#include <optional>
#include <string>

namespace runmap::inspect {

/**
 * What the tool should report
 */
enum class Query { LIST, NUMBER, NEWEST, OLDEST };

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Directory whose subdirectories are the builds */
    std::optional<std::string> builds_dir;

    /** Build number to look up when query is NUMBER */
    std::optional<buildmap::BuildNumber> number;

    Query query = Query::LIST;

    /** File that marks a directory as holding a finished build */
    std::string marker_name = "build.xml";

    /** Log verbosity level (none, error, warn, info, debug) */
    std::string log_level = "warn";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace runmap::inspect
