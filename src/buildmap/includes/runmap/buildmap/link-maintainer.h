#pragma once

#include "runmap/buildmap/build.h"
#include "runmap/buildmap/index-snapshot.h"

namespace runmap::buildmap {

/**
 * Keeps the previous/next links of an unpublished snapshot in step with
 * its loaded builds.
 *
 * Both operations edit only the snapshot they are given and only consult
 * builds already loaded into it. Callers serialize them with every other
 * structural change and publish the snapshot afterwards.
 */
class LinkMaintainer
{
public:
    /**
     * Link a build that has just been added to `index` between its nearest
     * loaded neighbours, and point those neighbours back at it.
     */
    static void
    on_insert(IndexSnapshot& index, BuildNumber number);

    /**
     * Splice a build out of the chain before it leaves `index`: its loaded
     * previous now points forward to its next, and its loaded next points
     * back to its previous.
     *
     * The removed build's own links are left as they were.
     */
    static void
    on_remove(IndexSnapshot& index, BuildNumber number);
};

}  // namespace runmap::buildmap
