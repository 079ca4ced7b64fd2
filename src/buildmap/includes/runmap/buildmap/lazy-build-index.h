#pragma once

#include "runmap/buildmap/build.h"
#include "runmap/buildmap/directory-filter.h"
#include "runmap/buildmap/index-snapshot.h"
#include "runmap/buildmap/load-options.h"
#include "runmap/buildmap/record-loader.h"

#include <atomic>
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace runmap::buildmap {

enum class Direction {
    ASC,   // smallest number >= key
    DESC,  // greatest number <= key
    EXACT  // number == key
};

struct LoadStats
{
    std::uint64_t listings = 0;       // directory listings performed
    std::uint64_t load_attempts = 0;  // calls into the RecordLoader
    std::uint64_t builds_loaded = 0;  // attempts that produced a build
};

/**
 * Number-keyed index over a builds directory, populated on demand.
 *
 * Two caches are kept apart: which directory names might hold builds
 * (one cheap directory listing) and which builds have been materialized
 * (one RecordLoader call per directory). Build numbers are assumed to grow
 * with the directory names, which lets search() binary-search the listing
 * and load only the directories it visits.
 *
 * Every structural change copies the current snapshot, edits the copy and
 * publishes it atomically under write_mutex_. Readers only ever load the
 * published pointer. Concurrent loads of the same directory are coalesced
 * so exactly one RecordLoader call runs and every caller gets its result.
 */
class LazyBuildIndex
{
public:
    using CandidateList = std::vector<std::string>;

    /**
     * @throws NullConstructorError if cons is empty
     */
    LazyBuildIndex(
        boost::filesystem::path base_dir,
        BuildConstructor cons,
        LoadOptions options = LoadOptions());

    LazyBuildIndex(const LazyBuildIndex&) = delete;
    LazyBuildIndex&
    operator=(const LazyBuildIndex&) = delete;

    /**
     * The build with this number, loading it on first access
     */
    BuildPtr
    get(BuildNumber number);

    /**
     * The build stored in the named directory, loading it on first access.
     * Only names in the current candidate listing resolve.
     */
    BuildPtr
    get_by_id(const std::string& id);

    /**
     * Nearest loaded-or-loadable build in the given direction from key
     */
    BuildPtr
    search(BuildNumber key, Direction direction);

    /**
     * Register a build created in-process, such as one that just started.
     *
     * @return The build previously indexed under the same number, if any
     * @throws BuildMapError if build is null or its id would not be accepted
     * as a build directory name
     */
    BuildPtr
    put(BuildPtr build);

    /**
     * Remove this exact build instance, fixing up its neighbours' links.
     *
     * @return true if the build was indexed and has been removed
     */
    bool
    remove_value(const Build& build);

    std::shared_ptr<const IndexSnapshot>
    snapshot() const
    {
        return snapshot_.load();
    }

    /**
     * Candidate directory names in ascending order, listing the builds
     * directory on first use
     */
    std::shared_ptr<const CandidateList>
    candidates();

    /** Forget the directory listing; the next query lists again */
    void
    purge_listing();

    /** Forget which directories were found empty */
    void
    purge_holes();

    void
    purge_cache();

    LoadStats
    stats() const;

    const boost::filesystem::path&
    base_dir() const
    {
        return base_dir_;
    }

private:
    BuildPtr
    load(const std::string& id);

    void
    finish_loading(const std::string& id);

    BuildPtr
    publish_loaded(const std::string& id, BuildPtr build);

    void
    publish(std::shared_ptr<IndexSnapshot> next);

    void
    forget_candidate(const std::string& id);

    void
    add_candidate(const std::string& id);

    const boost::filesystem::path base_dir_;
    DirectoryFilter filter_;
    RecordLoader loader_;

    std::atomic<std::shared_ptr<const IndexSnapshot>> snapshot_;
    std::mutex write_mutex_;

    std::atomic<std::shared_ptr<const CandidateList>> candidates_;
    std::mutex listing_mutex_;

    std::mutex loading_mutex_;
    std::unordered_map<std::string, std::shared_future<BuildPtr>> loading_;

    std::atomic<std::uint64_t> listings_{0};
    std::atomic<std::uint64_t> load_attempts_{0};
    std::atomic<std::uint64_t> builds_loaded_{0};
};

}  // namespace runmap::buildmap
