#include "runmap/buildmap/build-map.h"
#include "runmap/buildmap/buildmap-errors.h"

#include <utility>

namespace fs = boost::filesystem;

namespace runmap::buildmap {

namespace {

std::shared_ptr<const IndexSnapshot>
empty_snapshot()
{
    static const auto empty = std::make_shared<const IndexSnapshot>();
    return empty;
}

}  // namespace

BuildMap::BuildMap() = default;

BuildMap::BuildMap(fs::path base_dir, BuildConstructor cons, LoadOptions options)
    : index_(std::make_unique<LazyBuildIndex>(
          std::move(base_dir),
          std::move(cons),
          std::move(options)))
{
}

void
BuildMap::load(fs::path base_dir, BuildConstructor cons, LoadOptions options)
{
    index_ = std::make_unique<LazyBuildIndex>(
        std::move(base_dir), std::move(cons), std::move(options));
}

BuildPtr
BuildMap::get(BuildNumber number)
{
    return index_ ? index_->get(number) : nullptr;
}

BuildPtr
BuildMap::get_by_id(const std::string& id)
{
    return index_ ? index_->get_by_id(id) : nullptr;
}

BuildPtr
BuildMap::search(BuildNumber key, Direction direction)
{
    return index_ ? index_->search(key, direction) : nullptr;
}

BuildPtr
BuildMap::newest_value()
{
    return search(MAX_BUILD_NUMBER, Direction::DESC);
}

BuildPtr
BuildMap::oldest_value()
{
    return search(MIN_BUILD_NUMBER, Direction::ASC);
}

BuildPtr
BuildMap::put(BuildPtr build)
{
    if (!index_)
    {
        throw BuildMapError("put() on a build map with no builds directory");
    }
    return index_->put(std::move(build));
}

bool
BuildMap::remove_value(const BuildPtr& build)
{
    if (!index_ || !build)
        return false;
    return index_->remove_value(*build);
}

BuildLinks
BuildMap::links_of(const Build& build) const
{
    return snapshot()->links_of(build.number());
}

BuildPtr
BuildMap::previous_of(const Build& build) const
{
    return SnapshotView(snapshot()).previous_of(build);
}

BuildPtr
BuildMap::next_of(const Build& build) const
{
    return SnapshotView(snapshot()).next_of(build);
}

std::shared_ptr<const IndexSnapshot>
BuildMap::snapshot() const
{
    return index_ ? index_->snapshot() : empty_snapshot();
}

void
BuildMap::purge_cache()
{
    if (index_)
        index_->purge_cache();
}

LoadStats
BuildMap::stats() const
{
    return index_ ? index_->stats() : LoadStats();
}

fs::path
BuildMap::base_dir() const
{
    return index_ ? index_->base_dir() : fs::path();
}

}  // namespace runmap::buildmap
