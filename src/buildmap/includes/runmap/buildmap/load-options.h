#pragma once

#include <string>

namespace runmap::buildmap {

/**
 * Loading configuration supplied by the owner of a build map
 */
struct LoadOptions
{
    /** File that must exist inside a build directory for it to hold a build */
    std::string marker_name = "build.xml";

    /** Directory names starting with this are legacy placeholders */
    std::string reserved_prefix = "0000";
};

}  // namespace runmap::buildmap
