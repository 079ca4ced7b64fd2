#include "runmap/buildmap/record-loader.h"
#include "runmap/buildmap/buildmap-errors.h"
#include "runmap/core/log-macros.h"

#include <boost/filesystem.hpp>
#include <ios>
#include <utility>

namespace fs = boost::filesystem;

namespace runmap::buildmap {

namespace {
LogPartition loader_log("buildmap.loader");
}  // namespace

RecordLoader::RecordLoader(BuildConstructor cons, LoadOptions options)
    : cons_(std::move(cons)), options_(std::move(options))
{
    if (!cons_)
    {
        throw NullConstructorError("RecordLoader requires a build constructor");
    }
}

BuildPtr
RecordLoader::retrieve(const fs::path& dir) const
{
    boost::system::error_code ec;
    bool has_marker = fs::exists(dir / options_.marker_name, ec);
    if (ec)
    {
        PLOGW(
            loader_log,
            "could not load ",
            dir.string(),
            ": ",
            ec.message());
        return nullptr;
    }
    if (!has_marker)
    {
        // In progress or deleted; not a problem
        PLOGD(loader_log, "No ", options_.marker_name, " in ", dir.string());
        return nullptr;
    }

    try
    {
        BuildPtr build = cons_(dir);
        if (!build)
        {
            PLOGD(loader_log, "Constructor declined ", dir.string());
            return nullptr;
        }
        build->on_load();
        return build;
    }
    catch (const BuildLoadError& e)
    {
        PLOGW(loader_log, "could not load ", dir.string(), ": ", e.what());
    }
    catch (const fs::filesystem_error& e)
    {
        PLOGW(loader_log, "could not load ", dir.string(), ": ", e.what());
    }
    catch (const std::ios_base::failure& e)
    {
        PLOGW(
            loader_log, "I/O error loading ", dir.string(), ": ", e.what());
    }
    catch (const std::exception& e)
    {
        PLOGW(
            loader_log,
            "could not construct build from ",
            dir.string(),
            ": ",
            e.what());
    }
    catch (...)
    {
        PLOGW(loader_log, "could not load ", dir.string(), ": unknown error");
    }
    return nullptr;
}

}  // namespace runmap::buildmap
