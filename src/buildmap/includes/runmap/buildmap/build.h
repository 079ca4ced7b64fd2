#pragma once

#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string>

namespace runmap::buildmap {

using BuildNumber = std::int64_t;

inline constexpr BuildNumber MIN_BUILD_NUMBER =
    std::numeric_limits<BuildNumber>::min();
inline constexpr BuildNumber MAX_BUILD_NUMBER =
    std::numeric_limits<BuildNumber>::max();

/**
 * A build materialized from its directory.
 *
 * The number and id are fixed at construction. Links to the neighbouring
 * loaded builds are not stored here; they belong to the index snapshot and
 * are read through BuildMap::links_of()/previous_of()/next_of().
 *
 * Subclasses carry the actual build payload.
 */
class Build
{
public:
    Build(BuildNumber number, std::string id);
    virtual ~Build() = default;

    Build(const Build&) = delete;
    Build&
    operator=(const Build&) = delete;

    BuildNumber
    number() const
    {
        return number_;
    }

    const std::string&
    id() const
    {
        return id_;
    }

    /**
     * Called once after construction from disk, before the build becomes
     * visible through the map.
     */
    virtual void
    on_load()
    {
    }

private:
    const BuildNumber number_;
    const std::string id_;
};

using BuildPtr = std::shared_ptr<Build>;

/**
 * Factory that builds a Build from its directory.
 *
 * Returns nullptr when the directory holds nothing usable; throws
 * BuildLoadError (or any std::exception) when construction fails.
 */
using BuildConstructor =
    std::function<BuildPtr(const boost::filesystem::path& dir)>;

}  // namespace runmap::buildmap
