#ifndef MANIFEST_PARSER_H
#define MANIFEST_PARSER_H

#include <core/id_types.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace wsm {
namespace workspace {

// Thrown when a package.xml cannot be read, is not well-formed XML,
// or does not declare a package name.
class ManifestParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PackageManifest {
    PackageId name;
    PackageIdSet dependencies; // union of all dependency kinds, raw (may be external)
};

/*
 * Parses a package.xml (format 1, 2 or 3) into its name and dependency set.
 * Recognized dependency kinds: depend, build_depend, build_export_depend,
 * exec_depend and test_depend. Duplicates across kinds collapse.
 */
PackageManifest ParseManifest(const std::filesystem::path& manifest_path);

// Same as ParseManifest but from an in-memory document. `source_name` is only
// used in error messages.
PackageManifest ParseManifestString(const std::string& xml, const std::string& source_name = "<memory>");

} // namespace workspace
} // namespace wsm

#endif // MANIFEST_PARSER_H
