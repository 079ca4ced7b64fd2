#pragma once

#include "runmap/buildmap/build.h"
#include "runmap/buildmap/load-options.h"
#include <boost/filesystem/path.hpp>

namespace runmap::buildmap {

/**
 * Turns one candidate build directory into a Build.
 *
 * A directory without the marker file is a hole and yields nullptr without
 * complaint. Construction failures are logged with the directory path and
 * also yield nullptr, so a single broken build never takes the map down.
 */
class RecordLoader
{
public:
    /**
     * @throws NullConstructorError if cons is empty
     */
    RecordLoader(BuildConstructor cons, LoadOptions options = LoadOptions());

    /**
     * Materialize the build in dir.
     *
     * @return The loaded build with on_load() already run, or nullptr
     */
    BuildPtr
    retrieve(const boost::filesystem::path& dir) const;

    const LoadOptions&
    options() const
    {
        return options_;
    }

private:
    BuildConstructor cons_;
    LoadOptions options_;
};

}  // namespace runmap::buildmap
