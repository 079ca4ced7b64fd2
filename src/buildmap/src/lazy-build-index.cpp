#include "runmap/buildmap/lazy-build-index.h"
#include "runmap/buildmap/buildmap-errors.h"
#include "runmap/buildmap/link-maintainer.h"
#include "runmap/core/log-macros.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace fs = boost::filesystem;

namespace runmap::buildmap {

namespace {
LogPartition index_log("buildmap.index");
}  // namespace

LazyBuildIndex::LazyBuildIndex(
    fs::path base_dir,
    BuildConstructor cons,
    LoadOptions options)
    : base_dir_(std::move(base_dir))
    , filter_(options)
    , loader_(std::move(cons), std::move(options))
    , snapshot_(std::make_shared<const IndexSnapshot>())
{
}

BuildPtr
LazyBuildIndex::get(BuildNumber number)
{
    return search(number, Direction::EXACT);
}

BuildPtr
LazyBuildIndex::get_by_id(const std::string& id)
{
    auto current = snapshot();
    if (auto it = current->by_id.find(id); it != current->by_id.end())
        return it->second;

    auto ids = candidates();
    if (!std::binary_search(ids->begin(), ids->end(), id))
        return nullptr;
    return load(id);
}

BuildPtr
LazyBuildIndex::search(BuildNumber key, Direction direction)
{
    auto current = snapshot();
    if (auto it = current->by_number.find(key); it != current->by_number.end())
        return it->second;

    // The nearest loaded builds on either side bound what must be loaded
    BuildPtr below;
    BuildPtr above;
    auto upper = current->by_number.upper_bound(key);
    if (upper != current->by_number.end())
        above = upper->second;
    if (upper != current->by_number.begin())
        below = std::prev(upper)->second;

    auto ids = candidates();
    auto first = below
        ? std::upper_bound(ids->begin(), ids->end(), below->id())
        : ids->begin();
    auto last = above ? std::lower_bound(first, ids->end(), above->id())
                      : ids->end();

    std::vector<std::string> pending;
    for (auto it = first; it != last; ++it)
    {
        if (!current->holes.contains(*it))
            pending.push_back(*it);
    }

    PLOGD(
        index_log,
        "Searching for #",
        key,
        " across ",
        pending.size(),
        " unloaded candidates");

    // Binary search by directory name; holes are dropped as they are found
    std::size_t lo = 0;
    std::size_t hi = pending.size();
    while (lo < hi)
    {
        std::size_t pivot = lo + (hi - lo) / 2;
        BuildPtr middle = load(pending[pivot]);
        if (!middle)
        {
            pending.erase(pending.begin() + pivot);
            --hi;
            continue;
        }

        if (middle->number() == key)
            return middle;

        if (middle->number() < key)
        {
            below = std::move(middle);
            lo = pivot + 1;
        }
        else
        {
            above = std::move(middle);
            hi = pivot;
        }
    }

    // Everything left of lo is below key, everything from lo on is above
    switch (direction)
    {
        case Direction::ASC:
            return above;
        case Direction::DESC:
            return below;
        case Direction::EXACT:
            break;
    }
    return nullptr;
}

BuildPtr
LazyBuildIndex::put(BuildPtr build)
{
    if (!build)
    {
        throw BuildMapError("put() requires a build");
    }
    if (!filter_.accept_name(build->id()))
    {
        throw BuildMapError(
            "put() of build #" + std::to_string(build->number()) +
            " with invalid id '" + build->id() + "'");
    }

    BuildPtr previous;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = snapshot_.load();

        auto existing = current->by_number.find(build->number());
        if (existing != current->by_number.end() && existing->second == build)
            return build;

        auto next = std::make_shared<IndexSnapshot>(*current);
        if (existing != current->by_number.end())
        {
            previous = existing->second;
            next->by_id.erase(previous->id());
        }
        next->by_number[build->number()] = build;
        next->by_id[build->id()] = build;
        next->holes.erase(build->id());
        LinkMaintainer::on_insert(*next, build->number());
        publish(std::move(next));
    }

    add_candidate(build->id());
    PLOGD(index_log, "Put build #", build->number(), " (", build->id(), ")");
    return previous;
}

bool
LazyBuildIndex::remove_value(const Build& build)
{
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = snapshot_.load();

        auto it = current->by_number.find(build.number());
        if (it == current->by_number.end() || it->second.get() != &build)
            return false;

        auto next = std::make_shared<IndexSnapshot>(*current);
        LinkMaintainer::on_remove(*next, build.number());
        next->by_number.erase(build.number());
        next->by_id.erase(build.id());
        // The directory is still on disk; don't load it back
        next->holes.insert(build.id());
        publish(std::move(next));
    }

    forget_candidate(build.id());
    PLOGD(index_log, "Removed build #", build.number(), " (", build.id(), ")");
    return true;
}

std::shared_ptr<const LazyBuildIndex::CandidateList>
LazyBuildIndex::candidates()
{
    if (auto cached = candidates_.load())
        return cached;

    std::lock_guard<std::mutex> lock(listing_mutex_);
    if (auto cached = candidates_.load())
        return cached;

    ++listings_;
    auto listed = std::make_shared<const CandidateList>(
        filter_.list_candidates(base_dir_));
    candidates_.store(listed);
    return listed;
}

void
LazyBuildIndex::purge_listing()
{
    std::lock_guard<std::mutex> lock(listing_mutex_);
    candidates_.store(nullptr);
}

void
LazyBuildIndex::purge_holes()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot_.load();
    if (current->holes.empty())
        return;

    auto next = std::make_shared<IndexSnapshot>(*current);
    next->holes.clear();
    publish(std::move(next));
}

void
LazyBuildIndex::purge_cache()
{
    purge_listing();
    purge_holes();
}

LoadStats
LazyBuildIndex::stats() const
{
    return LoadStats{
        .listings = listings_.load(),
        .load_attempts = load_attempts_.load(),
        .builds_loaded = builds_loaded_.load()};
}

BuildPtr
LazyBuildIndex::load(const std::string& id)
{
    std::promise<BuildPtr> promise;
    std::shared_future<BuildPtr> result;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(loading_mutex_);
        auto current = snapshot();
        if (auto it = current->by_id.find(id); it != current->by_id.end())
            return it->second;
        if (current->holes.contains(id))
            return nullptr;

        if (auto it = loading_.find(id); it != loading_.end())
        {
            result = it->second;
        }
        else
        {
            result = promise.get_future().share();
            loading_.emplace(id, result);
            owner = true;
        }
    }

    if (!owner)
        return result.get();

    BuildPtr build;
    try
    {
        ++load_attempts_;
        build = loader_.retrieve(base_dir_ / id);
        if (build)
            ++builds_loaded_;
        // Published before the in-flight entry goes away, so a later caller
        // always finds one or the other
        build = publish_loaded(id, std::move(build));
        promise.set_value(build);
    }
    catch (...)
    {
        promise.set_exception(std::current_exception());
        finish_loading(id);
        throw;
    }

    finish_loading(id);
    return build;
}

void
LazyBuildIndex::finish_loading(const std::string& id)
{
    std::lock_guard<std::mutex> lock(loading_mutex_);
    loading_.erase(id);
}

BuildPtr
LazyBuildIndex::publish_loaded(const std::string& id, BuildPtr build)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot_.load();
    auto next = std::make_shared<IndexSnapshot>(*current);

    if (build && build->id() != id)
    {
        PLOGW(
            index_log,
            "Build in ",
            (base_dir_ / id).string(),
            " reports id ",
            build->id(),
            "; ignoring it");
        build.reset();
    }

    if (build)
    {
        auto existing = current->by_number.find(build->number());
        if (existing != current->by_number.end())
        {
            // put() got there first
            if (existing->second->id() == id)
                return existing->second;

            PLOGW(
                index_log,
                "Build #",
                build->number(),
                " in ",
                id,
                " duplicates ",
                existing->second->id(),
                "; ignoring it");
            build.reset();
        }
    }

    if (!build)
    {
        next->holes.insert(id);
        publish(std::move(next));
        return nullptr;
    }

    next->by_number.emplace(build->number(), build);
    next->by_id.emplace(id, build);
    LinkMaintainer::on_insert(*next, build->number());
    publish(std::move(next));

    PLOGD(index_log, "Loaded build #", build->number(), " from ", id);
    return build;
}

void
LazyBuildIndex::publish(std::shared_ptr<IndexSnapshot> next)
{
    snapshot_.store(std::shared_ptr<const IndexSnapshot>(std::move(next)));
}

void
LazyBuildIndex::forget_candidate(const std::string& id)
{
    std::lock_guard<std::mutex> lock(listing_mutex_);
    auto cached = candidates_.load();
    if (!cached)
        return;

    auto it = std::lower_bound(cached->begin(), cached->end(), id);
    if (it == cached->end() || *it != id)
        return;

    auto next = std::make_shared<CandidateList>(*cached);
    next->erase(next->begin() + std::distance(cached->begin(), it));
    candidates_.store(std::shared_ptr<const CandidateList>(std::move(next)));
}

void
LazyBuildIndex::add_candidate(const std::string& id)
{
    std::lock_guard<std::mutex> lock(listing_mutex_);
    auto cached = candidates_.load();
    if (!cached)
        return;

    auto it = std::lower_bound(cached->begin(), cached->end(), id);
    if (it != cached->end() && *it == id)
        return;

    auto next = std::make_shared<CandidateList>(*cached);
    next->insert(next->begin() + std::distance(cached->begin(), it), id);
    candidates_.store(std::shared_ptr<const CandidateList>(std::move(next)));
}

}  // namespace runmap::buildmap
