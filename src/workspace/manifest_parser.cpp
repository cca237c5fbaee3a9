#include <workspace/manifest_parser.h>

#include <tinyxml.h>

#include <array>
#include <fstream>
#include <sstream>

namespace wsm {
namespace workspace {

namespace {

constexpr std::array<const char*, 5> kDependencyTags = {
    "depend",
    "build_depend",
    "build_export_depend",
    "exec_depend",
    "test_depend",
};

std::string Trim(const char* text) {
    if (!text) return "";
    std::string value(text);
    const char* whitespace = " \t\r\n";
    auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

} // anonymous namespace

PackageManifest ParseManifestString(const std::string& xml, const std::string& source_name) {
    TiXmlDocument doc;
    doc.Parse(xml.c_str(), nullptr, TIXML_ENCODING_UTF8);
    if (doc.Error()) {
        std::ostringstream msg;
        msg << "Malformed manifest " << source_name << " (line " << doc.ErrorRow()
            << "): " << doc.ErrorDesc();
        throw ManifestParseError(msg.str());
    }

    const TiXmlElement* root = doc.RootElement();
    if (!root) {
        throw ManifestParseError("Manifest " + source_name + " has no root element");
    }

    const TiXmlElement* name_elem = root->FirstChildElement("name");
    PackageManifest manifest;
    manifest.name = name_elem ? Trim(name_elem->GetText()) : "";
    if (manifest.name.empty()) {
        throw ManifestParseError("Manifest " + source_name + " does not declare a package name");
    }

    for (const char* tag : kDependencyTags) {
        for (const TiXmlElement* dep = root->FirstChildElement(tag); dep; dep = dep->NextSiblingElement(tag)) {
            std::string dep_name = Trim(dep->GetText());
            if (!dep_name.empty()) {
                manifest.dependencies.insert(std::move(dep_name));
            }
        }
    }
    return manifest;
}

PackageManifest ParseManifest(const std::filesystem::path& manifest_path) {
    std::ifstream in(manifest_path, std::ios::in | std::ios::binary);
    if (!in) {
        throw ManifestParseError("Cannot open manifest " + manifest_path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return ParseManifestString(buffer.str(), manifest_path.string());
}

} // namespace workspace
} // namespace wsm
