#pragma once

#include <pkgindex/config.hpp>
#include <pkgindex/http.hpp>
#include <pkgindex/index.hpp>
#include <pkgindex/process.hpp>
#include <pkgindex/result.hpp>
#include <memory>
#include <string>

namespace pkgindex {

enum class Transport { Git, Http };

const char* transport_name(Transport t);

// Git when a git executable resolves on the locator's search path.
// Chosen once per update; a failing transport never falls back to the other.
Transport select_transport(const ToolLocator& locator);

// Refreshes the archive inside a mirror directory.
class IndexSync {
public:
    virtual ~IndexSync() = default;
    virtual Status sync(const PackageIndex& index) = 0;
};

// Shallow clone of the index repository under <root>/update, then a
// `git archive` export of the published ref into 00-index.tar.
class GitIndexSync : public IndexSync {
public:
    static constexpr const char* kCloneBranch = "display";
    static constexpr const char* kPublishedRef = "current-hackage";
    static constexpr const char* kSigningKey = "D6CF60FD";

    GitIndexSync(const IndexConfig& config, CommandRunner& runner,
                 ToolLocator locator)
        : config_(config), runner_(runner), locator_(std::move(locator)) {}

    Status sync(const PackageIndex& index) override;

    // <root>/update/<repo-name>
    Result<std::string> clone_path() const;

private:
    const IndexConfig& config_;
    CommandRunner& runner_;
    ToolLocator locator_;
};

// Conditional GET of 00-index.tar.gz keyed on the cached entity tag.
class HttpIndexSync : public IndexSync {
public:
    // Bytes of the etag file sent back as If-None-Match
    static constexpr size_t kMaxEtagBytes = 512;

    HttpIndexSync(const IndexConfig& config, HttpClient& http)
        : config_(config), http_(http) {}

    Status sync(const PackageIndex& index) override;

private:
    const IndexConfig& config_;
    HttpClient& http_;
};

std::unique_ptr<IndexSync> make_index_sync(Transport transport,
                                           const IndexConfig& config,
                                           CommandRunner& runner,
                                           HttpClient& http,
                                           const ToolLocator& locator);

} // namespace pkgindex
