#include "runmap/inspect/xml-build.h"
#include "runmap/build-id/build-id.h"
#include "runmap/buildmap/buildmap-errors.h"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <utility>

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

namespace runmap::inspect {

XmlBuild::XmlBuild(
    buildmap::BuildNumber number,
    std::string id,
    std::string result)
    : Build(number, std::move(id)), result_(std::move(result))
{
}

std::shared_ptr<XmlBuild>
XmlBuild::from_directory(const fs::path& dir, const std::string& record_name)
{
    fs::path record = dir / record_name;
    pt::ptree tree;
    try
    {
        pt::read_xml(record.string(), tree);
    }
    catch (const pt::xml_parser_error& e)
    {
        throw buildmap::BuildLoadError(
            "Malformed build record " + record.string() + ": " + e.what());
    }

    if (tree.empty())
    {
        throw buildmap::BuildLoadError(
            "Empty build record " + record.string());
    }

    const pt::ptree& root = tree.front().second;
    auto number = root.get_optional<buildmap::BuildNumber>("number");
    if (!number)
    {
        throw buildmap::BuildLoadError(
            "Build record " + record.string() + " has no numeric <number>");
    }

    return std::make_shared<XmlBuild>(
        *number,
        dir.filename().string(),
        root.get<std::string>("result", ""));
}

void
XmlBuild::on_load()
{
    start_time_ = build_id::parse(id());
}

buildmap::BuildConstructor
xml_build_constructor(std::string record_name)
{
    return [record_name = std::move(record_name)](
               const fs::path& dir) -> buildmap::BuildPtr {
        return XmlBuild::from_directory(dir, record_name);
    };
}

}  // namespace runmap::inspect
