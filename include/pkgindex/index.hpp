#pragma once

#include <optional>
#include <string>

namespace pkgindex {

// Well-known files inside a mirror directory
inline constexpr const char* kIndexTar = "00-index.tar";
inline constexpr const char* kIndexTarGz = "00-index.tar.gz";
inline constexpr const char* kIndexTarGzTmp = "00-index.tar.gz.tmp";
inline constexpr const char* kIndexEtag = "00-index.tar.gz.etag";

// Handle to a directory that existed when the handle was made. It caches
// nothing: the archive inside may be missing or stale.
class PackageIndex {
public:
    const std::string& dir() const { return dir_; }

    std::string tar_path() const;       // canonical archive read by queries
    std::string tar_gz_path() const;    // last downloaded compressed archive
    std::string tmp_path() const;       // download staging file
    std::string etag_path() const;      // cached HTTP entity tag

private:
    explicit PackageIndex(std::string dir) : dir_(std::move(dir)) {}

    friend std::optional<PackageIndex> try_get_index(const std::string& dir);

    std::string dir_;
};

// A handle iff `dir` is an existing directory right now. The path is made
// absolute.
std::optional<PackageIndex> try_get_index(const std::string& dir);

} // namespace pkgindex
