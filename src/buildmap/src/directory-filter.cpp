#include "runmap/buildmap/directory-filter.h"
#include "runmap/build-id/build-id.h"
#include "runmap/core/log-macros.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <utility>

namespace fs = boost::filesystem;

namespace runmap::buildmap {

namespace {
LogPartition filter_log("buildmap.filter");
}  // namespace

DirectoryFilter::DirectoryFilter(LoadOptions options)
    : options_(std::move(options))
{
}

bool
DirectoryFilter::accept_name(const std::string& name) const
{
    // Placeholders from very old layouts, never a real build
    if (!options_.reserved_prefix.empty() &&
        name.starts_with(options_.reserved_prefix))
    {
        PLOGD(filter_log, "Skipping reserved directory name ", name);
        return false;
    }

    if (!build_id::is_canonical(name))
    {
        PLOGD(filter_log, "Skipping non-canonical directory name ", name);
        return false;
    }

    return true;
}

bool
DirectoryFilter::accept(const fs::path& parent, const std::string& name) const
{
    if (!accept_name(name))
        return false;

    boost::system::error_code ec;
    bool is_dir = fs::is_directory(parent / name, ec);
    if (ec || !is_dir)
    {
        PLOGD(
            filter_log, "Skipping ", (parent / name).string(), ": not a directory");
        return false;
    }
    return true;
}

std::vector<std::string>
DirectoryFilter::list_candidates(const fs::path& base_dir) const
{
    std::vector<std::string> names;

    boost::system::error_code ec;
    if (!fs::is_directory(base_dir, ec))
    {
        PLOGD(
            filter_log,
            "Builds directory ",
            base_dir.string(),
            " does not exist");
        return names;
    }

    fs::directory_iterator it(base_dir, ec);
    if (ec)
    {
        PLOGW(
            filter_log,
            "Could not list builds directory ",
            base_dir.string(),
            ": ",
            ec.message());
        return names;
    }

    for (fs::directory_iterator end; it != end;)
    {
        std::string name = it->path().filename().string();
        if (accept(base_dir, name))
            names.push_back(std::move(name));

        it.increment(ec);
        if (ec)
        {
            PLOGW(
                filter_log,
                "Listing of ",
                base_dir.string(),
                " stopped early: ",
                ec.message());
            break;
        }
    }

    // Canonical ids are fixed width, so text order is chronological order
    std::sort(names.begin(), names.end());
    PLOGD(
        filter_log,
        "Found ",
        names.size(),
        " candidate build directories in ",
        base_dir.string());
    return names;
}

}  // namespace runmap::buildmap
