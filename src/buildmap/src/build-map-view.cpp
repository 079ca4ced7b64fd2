#include "runmap/buildmap/build-map-view.h"
#include "runmap/buildmap/build-map.h"

#include <utility>

namespace runmap::buildmap {

SnapshotView::SnapshotView(std::shared_ptr<const IndexSnapshot> snapshot)
    : snapshot_(std::move(snapshot))
{
}

BuildPtr
SnapshotView::find(BuildNumber number) const
{
    auto it = snapshot_->by_number.find(number);
    return it != snapshot_->by_number.end() ? it->second : nullptr;
}

std::vector<BuildPtr>
SnapshotView::head(BuildNumber to) const
{
    std::vector<BuildPtr> builds;
    auto last = snapshot_->by_number.lower_bound(to);
    for (auto it = snapshot_->by_number.begin(); it != last; ++it)
        builds.push_back(it->second);
    return builds;
}

std::vector<BuildPtr>
SnapshotView::tail(BuildNumber from) const
{
    std::vector<BuildPtr> builds;
    for (auto it = snapshot_->by_number.lower_bound(from);
         it != snapshot_->by_number.end();
         ++it)
        builds.push_back(it->second);
    return builds;
}

BuildPtr
SnapshotView::previous_of(const Build& build) const
{
    auto links = links_of(build);
    return links.previous ? find(*links.previous) : nullptr;
}

BuildPtr
SnapshotView::next_of(const Build& build) const
{
    auto links = links_of(build);
    return links.next ? find(*links.next) : nullptr;
}

SnapshotView
BuildMapView::pin() const
{
    return SnapshotView(map_->snapshot());
}

std::size_t
BuildMapView::size() const
{
    return map_->snapshot()->by_number.size();
}

bool
BuildMapView::empty() const
{
    return map_->snapshot()->by_number.empty();
}

bool
BuildMapView::contains(BuildNumber number) const
{
    return map_->snapshot()->by_number.contains(number);
}

BuildPtr
BuildMapView::find(BuildNumber number) const
{
    return pin().find(number);
}

std::optional<BuildNumber>
BuildMapView::first_key() const
{
    auto current = map_->snapshot();
    if (current->by_number.empty())
        return std::nullopt;
    return current->by_number.begin()->first;
}

std::optional<BuildNumber>
BuildMapView::last_key() const
{
    auto current = map_->snapshot();
    if (current->by_number.empty())
        return std::nullopt;
    return current->by_number.rbegin()->first;
}

std::vector<BuildNumber>
BuildMapView::keys() const
{
    std::vector<BuildNumber> numbers;
    for (const auto& [number, build] : pin())
        numbers.push_back(number);
    return numbers;
}

}  // namespace runmap::buildmap
