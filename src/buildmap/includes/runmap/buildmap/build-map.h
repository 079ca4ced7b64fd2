#pragma once

#include "runmap/buildmap/build-map-view.h"
#include "runmap/buildmap/build.h"
#include "runmap/buildmap/index-snapshot.h"
#include "runmap/buildmap/lazy-build-index.h"
#include "runmap/buildmap/load-options.h"

#include <boost/filesystem/path.hpp>
#include <memory>
#include <string>

namespace runmap::buildmap {

/**
 * Map from build number to Build over a builds directory.
 *
 * Builds are loaded lazily from `base_dir/<id>/` and kept linked to their
 * loaded neighbours. All operations are thread safe; readers work against
 * immutable snapshots and never see a half-applied change.
 *
 * Failures to load individual builds are logged and surface as absent
 * builds, never as exceptions.
 */
class BuildMap
{
public:
    /**
     * Unbound map; behaves as empty until load() is called.
     */
    [[deprecated("Use BuildMap(base_dir, cons)")]] BuildMap();

    /**
     * @param base_dir Directory whose subdirectories hold the builds
     * @param cons Used to create a Build from its directory
     * @throws NullConstructorError if cons is empty
     */
    BuildMap(
        boost::filesystem::path base_dir,
        BuildConstructor cons,
        LoadOptions options = LoadOptions());

    BuildMap(const BuildMap&) = delete;
    BuildMap&
    operator=(const BuildMap&) = delete;

    /**
     * Bind an unbound map to its builds directory.
     *
     * Must happen before the map is shared between threads. Loading is
     * lazy; nothing is read from disk here.
     */
    [[deprecated("Use BuildMap(base_dir, cons)")]] void
    load(
        boost::filesystem::path base_dir,
        BuildConstructor cons,
        LoadOptions options = LoadOptions());

    bool
    is_bound() const
    {
        return index_ != nullptr;
    }

    BuildPtr
    get(BuildNumber number);

    BuildPtr
    get_by_id(const std::string& id);

    BuildPtr
    search(BuildNumber key, Direction direction);

    /**
     * This is the newest build (with the biggest build number)
     */
    BuildPtr
    newest_value();

    /**
     * This is the oldest build (with the smallest build number)
     */
    BuildPtr
    oldest_value();

    BuildPtr
    put(BuildPtr build);

    bool
    remove_value(const BuildPtr& build);

    bool
    remove(const BuildPtr& build)
    {
        return remove_value(build);
    }

    /**
     * Numbers of the loaded builds on either side of this one.
     *
     * A removed build still reports the neighbours it had when it was
     * removed.
     */
    BuildLinks
    links_of(const Build& build) const;

    /** Loaded build linked before this one, if it is still indexed */
    BuildPtr
    previous_of(const Build& build) const;

    /** Loaded build linked after this one, if it is still indexed */
    BuildPtr
    next_of(const Build& build) const;

    BuildMapView
    view() const
    {
        return BuildMapView(*this);
    }

    std::shared_ptr<const IndexSnapshot>
    snapshot() const;

    void
    purge_cache();

    LoadStats
    stats() const;

    /** Empty for an unbound map */
    boost::filesystem::path
    base_dir() const;

private:
    std::unique_ptr<LazyBuildIndex> index_;
};

}  // namespace runmap::buildmap
