#include "runmap/buildmap/build-map.h"
#include "runmap/core/logger.h"
#include "runmap/inspect/arg-options.h"
#include "runmap/inspect/xml-build.h"

#include <iostream>
#include <memory>
#include <string>

using namespace runmap::buildmap;
using namespace runmap::inspect;

namespace {

void
print_build(std::ostream& out, const BuildMap& map, const BuildPtr& build)
{
    auto xml = std::dynamic_pointer_cast<XmlBuild>(build);
    out << "#" << build->number() << "  " << build->id();
    if (xml && !xml->result().empty())
        out << "  " << xml->result();
    if (auto previous = map.previous_of(*build))
        out << "  previous=#" << previous->number();
    if (auto next = map.next_of(*build))
        out << "  next=#" << next->number();
    out << std::endl;
}

int
run_query(const CommandLineOptions& options)
{
    LoadOptions load_options;
    load_options.marker_name = options.marker_name;

    BuildMap map(
        *options.builds_dir,
        xml_build_constructor(options.marker_name),
        load_options);

    switch (options.query)
    {
        case Query::NUMBER: {
            auto build = map.get(*options.number);
            if (!build)
            {
                std::cerr << "No build #" << *options.number << " in "
                          << *options.builds_dir << std::endl;
                return 1;
            }
            print_build(std::cout, map, build);
            return 0;
        }
        case Query::NEWEST:
        case Query::OLDEST: {
            auto build = options.query == Query::NEWEST ? map.newest_value()
                                                        : map.oldest_value();
            if (!build)
            {
                std::cerr << "No builds in " << *options.builds_dir
                          << std::endl;
                return 1;
            }
            print_build(std::cout, map, build);
            return 0;
        }
        case Query::LIST:
            break;
    }

    // Walk upwards one search at a time; each step loads what it needs
    std::size_t count = 0;
    for (auto build = map.oldest_value(); build;)
    {
        print_build(std::cout, map, build);
        ++count;
        if (build->number() == MAX_BUILD_NUMBER)
            break;
        build = map.search(build->number() + 1, Direction::ASC);
    }

    auto stats = map.stats();
    LOGI(
        "Listed ",
        count,
        " builds with ",
        stats.load_attempts,
        " load attempts and ",
        stats.listings,
        " directory listings");
    return 0;
}

}  // namespace

int
main(int argc, char* argv[])
{
    CommandLineOptions options = parse_argv(argc, argv);

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    if (!Logger::set_level(options.log_level))
    {
        std::cerr << "Error: unknown log level " << options.log_level
                  << std::endl;
        return 1;
    }

    try
    {
        return run_query(options);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
