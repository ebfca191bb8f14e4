#pragma once

#include <pkgindex/config.hpp>
#include <pkgindex/http.hpp>
#include <pkgindex/index.hpp>
#include <pkgindex/name.hpp>
#include <pkgindex/process.hpp>
#include <pkgindex/result.hpp>
#include <pkgindex/sync.hpp>
#include <pkgindex/version.hpp>
#include <optional>
#include <set>
#include <string>

namespace pkgindex {

// Entry point tying configuration, transports and queries together.
//
// Layout:
//   <mirror>/00-index.tar            archive read by queries
//   <mirror>/00-index.tar.gz         last HTTP download
//   <mirror>/00-index.tar.gz.tmp     HTTP staging file
//   <mirror>/00-index.tar.gz.etag    entity tag for conditional GET
//   <root>/update/<repo>/            shallow git clone
//
// Nothing guards the mirror against a second process refreshing or reading
// it at the same time.
class IndexManager {
public:
    IndexManager(IndexConfig config, CommandRunner& runner, HttpClient& http,
                 ToolLocator locator);

    // Handle for `dir`, synchronizing it first if the directory is missing.
    // The directory is created before syncing and stays even when the sync
    // fails, in which case the sync error is returned.
    Result<PackageIndex> ensure(const std::string& dir);

    // Handle for the configured mirror directory
    Result<PackageIndex> ensure();

    // Refresh the archive through the transport chosen for this call
    Status update(const PackageIndex& index);

    Transport transport() const;

    Result<std::optional<std::set<Version>>> versions(const PackageIndex& index,
                                                      const PackageName& name) const;

    const IndexConfig& config() const { return config_; }

private:
    IndexConfig config_;
    CommandRunner& runner_;
    HttpClient& http_;
    ToolLocator locator_;
};

} // namespace pkgindex
