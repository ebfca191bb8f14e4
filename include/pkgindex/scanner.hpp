#pragma once

#include <pkgindex/index.hpp>
#include <pkgindex/name.hpp>
#include <pkgindex/result.hpp>
#include <pkgindex/version.hpp>
#include <optional>
#include <set>
#include <string>

namespace pkgindex {

// Suffix of the per-version metadata record: <name>/<version>/<name>.json
inline constexpr const char* kMetadataSuffix = ".json";

// If `entry_path` has the shape name/version/name.json, fill name and
// version with the first two segments.
bool split_metadata_path(const std::string& entry_path,
                         std::string& name, std::string& version);

// Every version of `name` listed in the index archive, in one forward pass.
//
// nullopt when no record matches. A matching record whose version segment
// does not parse aborts the scan with a Version error naming the entry; a
// damaged archive yields IndexCorrupt with the archive path. A missing
// archive is NotFound.
Result<std::optional<std::set<Version>>> package_versions(const PackageIndex& index,
                                                         const PackageName& name);

} // namespace pkgindex
