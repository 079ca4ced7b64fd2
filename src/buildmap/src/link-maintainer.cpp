#include "runmap/buildmap/link-maintainer.h"

#include <iterator>

namespace runmap::buildmap {

void
LinkMaintainer::on_insert(IndexSnapshot& index, BuildNumber number)
{
    BuildLinks links;

    auto it = index.by_number.lower_bound(number);
    if (it != index.by_number.begin())
    {
        links.previous = std::prev(it)->first;
    }
    if (it != index.by_number.end() && it->first == number)
    {
        ++it;
    }
    if (it != index.by_number.end())
    {
        links.next = it->first;
    }

    index.links[number] = links;
    if (links.previous)
    {
        index.links[*links.previous].next = number;
    }
    if (links.next)
    {
        index.links[*links.next].previous = number;
    }
}

void
LinkMaintainer::on_remove(IndexSnapshot& index, BuildNumber number)
{
    auto removed = index.links.find(number);
    if (removed == index.links.end())
        return;
    BuildLinks links = removed->second;

    if (links.next && index.by_number.contains(*links.next))
    {
        index.links[*links.next].previous = links.previous;
    }
    if (links.previous && index.by_number.contains(*links.previous))
    {
        index.links[*links.previous].next = links.next;
    }
}

}  // namespace runmap::buildmap
