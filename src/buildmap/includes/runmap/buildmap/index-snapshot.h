#pragma once

#include "runmap/buildmap/build.h"
#include <map>
#include <optional>
#include <set>
#include <string>

namespace runmap::buildmap {

/**
 * Numbers of the loaded builds on either side of a build
 */
struct BuildLinks
{
    std::optional<BuildNumber> previous;
    std::optional<BuildNumber> next;

    bool
    operator==(const BuildLinks&) const = default;
};

/**
 * One version of the index.
 *
 * Snapshots are built privately, published once, and never modified after
 * publication; a reader holding one can iterate it while writers publish
 * newer versions. Links are part of the snapshot, so a reader always sees
 * them agree with the builds it holds.
 */
struct IndexSnapshot
{
    /** Loaded builds, ascending by number */
    std::map<BuildNumber, BuildPtr> by_number;

    /** The same builds keyed by directory name */
    std::map<std::string, BuildPtr> by_id;

    /** Candidate directories known to hold no build */
    std::set<std::string> holes;

    /**
     * Previous/next of every loaded build. A removed build keeps the entry
     * it had when it was removed until its number is loaded again.
     */
    std::map<BuildNumber, BuildLinks> links;

    BuildLinks
    links_of(BuildNumber number) const
    {
        auto it = links.find(number);
        return it != links.end() ? it->second : BuildLinks{};
    }
};

}  // namespace runmap::buildmap
