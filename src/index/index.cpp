#include <pkgindex/index.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace pkgindex {

std::string PackageIndex::tar_path() const {
    return (fs::path(dir_) / kIndexTar).string();
}

std::string PackageIndex::tar_gz_path() const {
    return (fs::path(dir_) / kIndexTarGz).string();
}

std::string PackageIndex::tmp_path() const {
    return (fs::path(dir_) / kIndexTarGzTmp).string();
}

std::string PackageIndex::etag_path() const {
    return (fs::path(dir_) / kIndexEtag).string();
}

std::optional<PackageIndex> try_get_index(const std::string& dir) {
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) {
        return std::nullopt;
    }
    fs::path abs = fs::absolute(dir, ec);
    if (ec) return std::nullopt;
    return PackageIndex(abs.lexically_normal().string());
}

} // namespace pkgindex
