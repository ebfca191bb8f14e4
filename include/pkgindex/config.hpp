#pragma once

#include <pkgindex/log.hpp>
#include <pkgindex/result.hpp>
#include <string>
#include <optional>

namespace pkgindex {

// Settings consumed by index synchronization. Built from TOML layers and
// passed explicitly into IndexManager; sync code never reads the
// environment on its own.
//
//   [index]
//   git-url = "https://github.com/commercialhaskell/all-cabal-hashes.git"
//   http-url = "https://s3.amazonaws.com/hackage.fpcomplete.com/00-index.tar.gz"
//   root = "~/.pkgindex"
//   mirror = "~/.pkgindex/indices/hackage"
//   verify-signatures = false
//
//   [timeouts]
//   git = 600    # seconds, 0 = no limit
//   http = 0
//
//   [log]
//   level = "info"
struct IndexConfig {
    std::string git_url;
    std::string http_url;
    std::string root;        // scratch area; git clones live under <root>/update
    std::string mirror_dir;  // empty means <root>/indices/hackage
    bool verify_signatures = false;
    int git_timeout = 600;
    int http_timeout = 0;
    log::Level log_level = log::Info;

    // Track which fields were explicitly set (for merge)
    bool git_url_set = false;
    bool http_url_set = false;
    bool root_set = false;
    bool mirror_dir_set = false;
    bool verify_signatures_set = false;
    bool git_timeout_set = false;
    bool http_timeout_set = false;
    bool log_level_set = false;

    // Built-in defaults; root is resolved from $HOME
    static IndexConfig defaults();

    // Load from a TOML config file
    static Result<IndexConfig> load(const std::string& path);

    // Parse from TOML string. Unset keys keep their defaults.
    static Result<IndexConfig> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly-set values win)
    void merge(const IndexConfig& other);

    // Defaults, then the global layer, then the local one
    static IndexConfig effective(const std::optional<IndexConfig>& global,
                                 const std::optional<IndexConfig>& local);

    // Directory holding the mirror artifacts
    std::string mirror_path() const;
};

// ~/.pkgindex/config.toml
std::string default_config_path();

// Replace a leading "~" with $HOME. Other paths are returned unchanged.
std::string expand_home(const std::string& path);

} // namespace pkgindex
