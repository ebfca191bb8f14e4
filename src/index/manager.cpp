#include <pkgindex/manager.hpp>
#include <pkgindex/log.hpp>
#include <pkgindex/scanner.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace pkgindex {

IndexManager::IndexManager(IndexConfig config, CommandRunner& runner,
                           HttpClient& http, ToolLocator locator)
    : config_(std::move(config)), runner_(runner), http_(http),
      locator_(std::move(locator)) {}

Result<PackageIndex> IndexManager::ensure(const std::string& dir) {
    if (auto idx = try_get_index(dir)) {
        return Result<PackageIndex>::ok(std::move(*idx));
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    auto idx = try_get_index(dir);
    if (ec || !idx) {
        return IndexError{IndexError::IO,
            "cannot create package index directory " + dir +
            (ec ? ": " + ec.message() : "")};
    }

    log::info("No package index found at %s, downloading it", idx->dir().c_str());
    PKGINDEX_TRY(update(*idx));
    return Result<PackageIndex>::ok(std::move(*idx));
}

Result<PackageIndex> IndexManager::ensure() {
    return ensure(config_.mirror_path());
}

Transport IndexManager::transport() const {
    return select_transport(locator_);
}

Status IndexManager::update(const PackageIndex& index) {
    Transport t = transport();
    log::debug("Updating package index in %s via %s",
               index.dir().c_str(), transport_name(t));

    auto sync = make_index_sync(t, config_, runner_, http_, locator_);
    return sync->sync(index);
}

Result<std::optional<std::set<Version>>> IndexManager::versions(
        const PackageIndex& index, const PackageName& name) const {
    return package_versions(index, name);
}

} // namespace pkgindex
