#pragma once

#include "runmap/buildmap/build.h"
#include "runmap/buildmap/index-snapshot.h"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace runmap::buildmap {

class BuildMap;

/**
 * One pinned snapshot of a build map, iterable in ascending number order.
 *
 * Holding a SnapshotView keeps its snapshot alive; later loads and removals
 * publish new snapshots and never disturb this one.
 */
class SnapshotView
{
public:
    using container_type = std::map<BuildNumber, BuildPtr>;
    using const_iterator = container_type::const_iterator;
    using value_type = container_type::value_type;

    explicit SnapshotView(std::shared_ptr<const IndexSnapshot> snapshot);

    const_iterator
    begin() const
    {
        return snapshot_->by_number.begin();
    }

    const_iterator
    end() const
    {
        return snapshot_->by_number.end();
    }

    std::size_t
    size() const
    {
        return snapshot_->by_number.size();
    }

    bool
    empty() const
    {
        return snapshot_->by_number.empty();
    }

    BuildPtr
    find(BuildNumber number) const;

    /** Builds numbered strictly below `to` */
    std::vector<BuildPtr>
    head(BuildNumber to) const;

    /** Builds numbered `from` and above */
    std::vector<BuildPtr>
    tail(BuildNumber from) const;

    BuildLinks
    links_of(const Build& build) const
    {
        return snapshot_->links_of(build.number());
    }

    /** Previous loaded build as of this snapshot */
    BuildPtr
    previous_of(const Build& build) const;

    /** Next loaded build as of this snapshot */
    BuildPtr
    next_of(const Build& build) const;

private:
    std::shared_ptr<const IndexSnapshot> snapshot_;
};

/**
 * Read-only view of a BuildMap.
 *
 * Every call reads the most recently published snapshot, so the view follows
 * the map as builds are loaded or removed. It offers no way to change the
 * map. Use pin() to iterate a single consistent version.
 *
 * The view must not outlive its map.
 */
class BuildMapView
{
public:
    explicit BuildMapView(const BuildMap& map) : map_(&map)
    {
    }

    SnapshotView
    pin() const;

    std::size_t
    size() const;

    bool
    empty() const;

    bool
    contains(BuildNumber number) const;

    BuildPtr
    find(BuildNumber number) const;

    std::optional<BuildNumber>
    first_key() const;

    std::optional<BuildNumber>
    last_key() const;

    std::vector<BuildNumber>
    keys() const;

private:
    const BuildMap* map_;
};

}  // namespace runmap::buildmap
