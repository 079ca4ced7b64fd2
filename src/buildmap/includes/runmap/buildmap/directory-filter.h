#pragma once

#include "runmap/buildmap/load-options.h"
#include <boost/filesystem/path.hpp>
#include <string>
#include <vector>

namespace runmap::buildmap {

/**
 * Decides which subdirectories of a builds directory are candidate builds.
 *
 * A name is accepted when it does not carry the reserved legacy prefix and
 * round-trips through the canonical build id encoding. Rejections are
 * routine and only logged at debug level.
 */
class DirectoryFilter
{
public:
    explicit DirectoryFilter(LoadOptions options = LoadOptions());

    /**
     * Check a directory name alone, without touching the filesystem
     */
    [[nodiscard]] bool
    accept_name(const std::string& name) const;

    /**
     * Check a name and that `parent / name` is a directory
     */
    [[nodiscard]] bool
    accept(const boost::filesystem::path& parent, const std::string& name)
        const;

    /**
     * List the accepted subdirectory names of base_dir in ascending order.
     *
     * A missing or unreadable base directory yields an empty or partial
     * listing; the failure is logged, never thrown.
     */
    std::vector<std::string>
    list_candidates(const boost::filesystem::path& base_dir) const;

private:
    LoadOptions options_;
};

}  // namespace runmap::buildmap
