#include <pkgindex/scanner.hpp>
#include <pkgindex/archive.hpp>
#include <pkgindex/log.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace pkgindex {

bool split_metadata_path(const std::string& entry_path,
                         std::string& name, std::string& version) {
    auto s1 = entry_path.find('/');
    if (s1 == std::string::npos) return false;
    auto s2 = entry_path.find('/', s1 + 1);
    if (s2 == std::string::npos) return false;
    if (entry_path.find('/', s2 + 1) != std::string::npos) return false;

    std::string n = entry_path.substr(0, s1);
    std::string file = entry_path.substr(s2 + 1);
    if (file != n + kMetadataSuffix) return false;

    name = std::move(n);
    version = entry_path.substr(s1 + 1, s2 - s1 - 1);
    return true;
}

Result<std::optional<std::set<Version>>> package_versions(const PackageIndex& index,
                                                         const PackageName& name) {
    std::string tar_file = index.tar_path();

    std::error_code ec;
    if (!fs::is_regular_file(tar_file, ec)) {
        return IndexError{IndexError::NotFound,
            "package index tarball not found: " + tar_file,
            "update the package index first"};
    }

    log::debug("Iterating through tarball %s", tar_file.c_str());

    TarReader reader;
    PKGINDEX_TRY(reader.open(tar_file));

    std::set<Version> versions;
    while (true) {
        auto next = reader.next();
        if (next.is_err()) return std::move(next).error();
        if (!next.value()) break;

        const TarEntry& entry = *next.value();
        std::string entry_name, entry_version;
        if (!split_metadata_path(entry.path, entry_name, entry_version)) continue;
        if (entry_name != name.str()) continue;

        auto ver = Version::parse(entry_version)
                       .with_file(entry.path, "bad version in index entry: ");
        PKGINDEX_TRY(ver);
        versions.insert(std::move(ver).value());
    }

    if (versions.empty()) {
        return Result<std::optional<std::set<Version>>>::ok(std::nullopt);
    }
    return Result<std::optional<std::set<Version>>>::ok(std::move(versions));
}

} // namespace pkgindex
