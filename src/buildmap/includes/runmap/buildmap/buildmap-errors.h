#pragma once

#include <stdexcept>
#include <string>

namespace runmap::buildmap {

// Base exception for build map errors
class BuildMapError : public std::runtime_error
{
public:
    explicit BuildMapError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

// Thrown by a BuildConstructor when a build directory cannot be turned into
// a build. The loader contains it; it never reaches index callers.
class BuildLoadError : public BuildMapError
{
public:
    explicit BuildLoadError(const std::string& msg) : BuildMapError(msg)
    {
    }
};

// A map or loader was given an empty BuildConstructor
class NullConstructorError : public BuildMapError
{
public:
    explicit NullConstructorError(const std::string& msg) : BuildMapError(msg)
    {
    }
};

}  // namespace runmap::buildmap
