#include "runmap/buildmap/build.h"

#include <utility>

namespace runmap::buildmap {

Build::Build(BuildNumber number, std::string id)
    : number_(number), id_(std::move(id))
{
}

}  // namespace runmap::buildmap
