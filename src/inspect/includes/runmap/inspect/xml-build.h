#pragma once

#include "runmap/buildmap/build.h"
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace runmap::inspect {

/**
 * Build described by an XML record file inside its directory:
 *
 *   <build>
 *     <number>42</number>
 *     <result>SUCCESS</result>
 *   </build>
 *
 * The root element name is not checked. `result` is optional.
 */
class XmlBuild : public buildmap::Build
{
public:
    XmlBuild(buildmap::BuildNumber number, std::string id, std::string result);

    /**
     * Read `dir / record_name`.
     *
     * @throws buildmap::BuildLoadError if the file is unreadable or lacks a
     * numeric `number` element
     */
    static std::shared_ptr<XmlBuild>
    from_directory(
        const boost::filesystem::path& dir,
        const std::string& record_name = "build.xml");

    const std::string&
    result() const
    {
        return result_;
    }

    /** Seconds since epoch decoded from the id; set by on_load() */
    std::optional<std::int64_t>
    start_time() const
    {
        return start_time_;
    }

    void
    on_load() override;

private:
    std::string result_;
    std::optional<std::int64_t> start_time_;
};

/**
 * BuildConstructor producing XmlBuilds from `record_name`
 */
buildmap::BuildConstructor
xml_build_constructor(std::string record_name = "build.xml");

}  // namespace runmap::inspect
