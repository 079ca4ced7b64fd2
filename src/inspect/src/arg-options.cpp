#include "runmap/inspect/arg-options.h"
#include "runmap/core/logger.h"

#include <boost/program_options.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace runmap::inspect {

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "builds-dir,d",
        po::value<std::string>(),
        "Directory containing one subdirectory per build")(
        "number,n",
        po::value<buildmap::BuildNumber>(),
        "Show the build with this number")(
        "newest", po::bool_switch(), "Show the build with the biggest number")(
        "oldest",
        po::bool_switch(),
        "Show the build with the smallest number")(
        "list", po::bool_switch(), "List every build, oldest first (default)")(
        "marker,m",
        po::value<std::string>()->default_value("build.xml"),
        "File that marks a build directory as complete")(
        "log-level,l",
        po::value<std::string>()->default_value("warn"),
        "Log level (none, error, warn, info, debug)");

    po::positional_options_description positional;
    positional.add("builds-dir", 1);

    std::ostringstream help_stream;
    help_stream << "Build Map Inspector" << std::endl
                << "-------------------" << std::endl
                << "Look up builds in a builds directory, loading only the "
                   "build directories a query needs"
                << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "runmap-inspect")
                << " [--builds-dir] <dir> [--number <n> | --newest | "
                   "--oldest | --list] [options]"
                << std::endl
                << desc << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("builds-dir"))
        {
            options.builds_dir = vm["builds-dir"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message =
                "No builds directory specified (--builds-dir)";
            return options;
        }

        int queries = 0;
        if (vm.count("number"))
        {
            options.number = vm["number"].as<buildmap::BuildNumber>();
            options.query = Query::NUMBER;
            ++queries;
        }
        if (vm["newest"].as<bool>())
        {
            options.query = Query::NEWEST;
            ++queries;
        }
        if (vm["oldest"].as<bool>())
        {
            options.query = Query::OLDEST;
            ++queries;
        }
        if (vm["list"].as<bool>())
        {
            options.query = Query::LIST;
            ++queries;
        }
        if (queries > 1)
        {
            options.valid = false;
            options.error_message =
                "Only one of --number, --newest, --oldest, --list may be given";
            return options;
        }

        options.marker_name = vm["marker"].as<std::string>();
        if (options.marker_name.empty())
        {
            options.valid = false;
            options.error_message = "Marker file name must not be empty";
            return options;
        }

        std::string level = vm["log-level"].as<std::string>();
        if (!Logger::parse_level(level))
        {
            options.valid = false;
            options.error_message =
                "Log level must be one of: none, error, warn, info, debug";
            return options;
        }
        options.log_level = level;
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        options.valid = false;
        options.error_message = std::string("Unexpected error: ") + e.what();
    }

    return options;
}

}  // namespace runmap::inspect
