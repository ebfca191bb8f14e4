#include <pkgindex/sync.hpp>
#include <pkgindex/git.hpp>
#include <pkgindex/log.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace pkgindex {

const char* transport_name(Transport t) {
    switch (t) {
        case Transport::Git:  return "git";
        case Transport::Http: return "http";
    }
    return "unknown";
}

Transport select_transport(const ToolLocator& locator) {
    return locator.find("git") ? Transport::Git : Transport::Http;
}

std::unique_ptr<IndexSync> make_index_sync(Transport transport,
                                           const IndexConfig& config,
                                           CommandRunner& runner,
                                           HttpClient& http,
                                           const ToolLocator& locator) {
    switch (transport) {
        case Transport::Git:
            return std::make_unique<GitIndexSync>(config, runner, locator);
        case Transport::Http:
            return std::make_unique<HttpIndexSync>(config, http);
    }
    return nullptr;
}

Result<std::string> GitIndexSync::clone_path() const {
    return repo_name_from_url(config_.git_url).map([this](std::string& name) {
        return (fs::path(config_.root) / "update" / name).string();
    });
}

Status GitIndexSync::sync(const PackageIndex& index) {
    std::error_code ec;
    fs::create_directories(index.dir(), ec);
    if (ec) {
        return IndexError{IndexError::IO,
            "cannot create " + index.dir() + ": " + ec.message()};
    }

    auto git_path = locator_.find("git");
    if (!git_path) {
        return IndexError{IndexError::ToolMissing,
            "git executable not found",
            "please install git and provide the executable on your PATH"};
    }
    GitCli git(runner_, *git_path);

    auto clone = clone_path();
    PKGINDEX_TRY(clone);

    fs::path repo_dir = clone.value();
    fs::path update_dir = repo_dir.parent_path();

    if (!fs::is_directory(repo_dir, ec)) {
        fs::create_directories(update_dir, ec);
        if (ec) {
            return IndexError{IndexError::IO,
                "cannot create " + update_dir.string() + ": " + ec.message()};
        }
        log::info("Cloning repository for first time from %s",
                  config_.git_url.c_str());
        PKGINDEX_TRY(git.clone_shallow(config_.git_url, repo_dir.filename().string(),
                                       kCloneBranch, update_dir.string()));
    }

    PKGINDEX_TRY(git.fetch_tags(repo_dir.string()));

    // A stale archive must not survive a failed export
    std::string tar_file = index.tar_path();
    fs::remove(tar_file, ec);

    if (config_.verify_signatures) {
        auto verified = git.verify_tag(repo_dir.string(), kPublishedRef);
        if (verified.is_err()) {
            auto e = std::move(verified).error();
            if (e.code == IndexError::Signature) {
                e.hint = std::string("Signature verification failed. ") +
                    "Please ensure you've set up your GPG keychain to accept the " +
                    kSigningKey + " signing key. For more information, see: " +
                    "https://github.com/fpco/stackage-update#readme";
            }
            return e;
        }
    }

    log::debug("Exporting a tarball to %s", tar_file.c_str());
    return git.archive(repo_dir.string(), kPublishedRef, tar_file);
}

} // namespace pkgindex
