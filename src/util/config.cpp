#include <pkgindex/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <limits>

namespace pkgindex {

static const char* kDefaultGitUrl =
    "https://github.com/commercialhaskell/all-cabal-hashes.git";
static const char* kDefaultHttpUrl =
    "https://s3.amazonaws.com/hackage.fpcomplete.com/00-index.tar.gz";

static std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return home;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    std::string home = home_dir();
    if (home.empty()) return path;
    return home + path.substr(1);
}

IndexConfig IndexConfig::defaults() {
    IndexConfig cfg;
    cfg.git_url = kDefaultGitUrl;
    cfg.http_url = kDefaultHttpUrl;
    std::string home = home_dir();
    cfg.root = (home.empty() ? std::string("/tmp") : home) + "/.pkgindex";
    return cfg;
}

static Status read_string(toml::node_view<toml::node> node, const char* key,
                          std::string& out, bool& set) {
    if (!node) return ok_status();
    auto v = node.value<std::string>();
    if (!v) {
        return IndexError{IndexError::Config,
            std::string("'") + key + "' must be a string"};
    }
    out = *v;
    set = true;
    return ok_status();
}

static Status read_timeout(toml::node_view<toml::node> node, const char* key,
                           int& out, bool& set) {
    if (!node) return ok_status();
    auto v = node.value<int64_t>();
    if (!v || *v < 0 || *v > std::numeric_limits<int>::max()) {
        return IndexError{IndexError::Config,
            std::string("'") + key + "' must be a non-negative integer no larger than " +
            std::to_string(std::numeric_limits<int>::max())};
    }
    out = static_cast<int>(*v);
    set = true;
    return ok_status();
}

Result<IndexConfig> IndexConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return IndexError{IndexError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    IndexConfig cfg = defaults();

    // [index] section
    if (doc["index"].is_table()) {
        auto tbl = doc["index"];
        PKGINDEX_TRY(read_string(tbl["git-url"], "index.git-url",
                                 cfg.git_url, cfg.git_url_set));
        PKGINDEX_TRY(read_string(tbl["http-url"], "index.http-url",
                                 cfg.http_url, cfg.http_url_set));
        PKGINDEX_TRY(read_string(tbl["root"], "index.root",
                                 cfg.root, cfg.root_set));
        PKGINDEX_TRY(read_string(tbl["mirror"], "index.mirror",
                                 cfg.mirror_dir, cfg.mirror_dir_set));
        cfg.root = expand_home(cfg.root);
        cfg.mirror_dir = expand_home(cfg.mirror_dir);

        if (auto node = tbl["verify-signatures"]) {
            auto v = node.value<bool>();
            if (!v) {
                return IndexError{IndexError::Config,
                    "'index.verify-signatures' must be a boolean"};
            }
            cfg.verify_signatures = *v;
            cfg.verify_signatures_set = true;
        }
    }

    // [timeouts] section
    if (doc["timeouts"].is_table()) {
        auto tbl = doc["timeouts"];
        PKGINDEX_TRY(read_timeout(tbl["git"], "timeouts.git",
                                  cfg.git_timeout, cfg.git_timeout_set));
        PKGINDEX_TRY(read_timeout(tbl["http"], "timeouts.http",
                                  cfg.http_timeout, cfg.http_timeout_set));
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto s = node.value<std::string>();
            auto lvl = s ? log::parse_level(*s) : std::nullopt;
            if (!lvl) {
                return IndexError{IndexError::Config,
                    "'log.level' must be one of trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }
    }

    return Result<IndexConfig>::ok(std::move(cfg));
}

static Result<std::string> read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return IndexError{IndexError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Result<IndexConfig> IndexConfig::load(const std::string& path) {
    return read_text(path)
        .and_then([](std::string& text) { return IndexConfig::parse(text); })
        .with_file(path);
}

void IndexConfig::merge(const IndexConfig& other) {
    if (other.git_url_set) {
        git_url = other.git_url;
        git_url_set = true;
    }
    if (other.http_url_set) {
        http_url = other.http_url;
        http_url_set = true;
    }
    if (other.root_set) {
        root = other.root;
        root_set = true;
    }
    if (other.mirror_dir_set) {
        mirror_dir = other.mirror_dir;
        mirror_dir_set = true;
    }
    if (other.verify_signatures_set) {
        verify_signatures = other.verify_signatures;
        verify_signatures_set = true;
    }
    if (other.git_timeout_set) {
        git_timeout = other.git_timeout;
        git_timeout_set = true;
    }
    if (other.http_timeout_set) {
        http_timeout = other.http_timeout;
        http_timeout_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

IndexConfig IndexConfig::effective(const std::optional<IndexConfig>& global,
                                   const std::optional<IndexConfig>& local) {
    IndexConfig result = defaults();
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string IndexConfig::mirror_path() const {
    if (!mirror_dir.empty()) return mirror_dir;
    return root + "/indices/hackage";
}

std::string default_config_path() {
    std::string home = home_dir();
    if (home.empty()) return "";
    return home + "/.pkgindex/config.toml";
}

} // namespace pkgindex
