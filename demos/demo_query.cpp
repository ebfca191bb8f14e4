// demo_query.cpp
//
// Looks up the published versions of a package in the local index mirror,
// downloading the mirror first if it does not exist yet. Run it with:
//
//     ./demo_query aeson                      # default config, ~/.pkgindex
//     ./demo_query aeson my-config.toml       # settings from a TOML file
//     ./demo_query aeson my-config.toml --update   # refresh before querying
//
// The transport is git when a git executable is on PATH, HTTP otherwise.

#include <pkgindex/config.hpp>
#include <pkgindex/http.hpp>
#include <pkgindex/log.hpp>
#include <pkgindex/manager.hpp>
#include <pkgindex/process.hpp>
#include <pkgindex/result.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace pkgindex;

// Global config if present, then the file named on the command line.
static Result<IndexConfig> load_config(int argc, char** argv) {
    std::optional<IndexConfig> global;
    std::string global_path = default_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = IndexConfig::load(global_path);
        PKGINDEX_TRY(g);
        global = std::move(g).value();
    }

    std::optional<IndexConfig> local;
    if (argc >= 3) {
        auto l = IndexConfig::load(argv[2]);
        PKGINDEX_TRY(l);
        local = std::move(l).value();
    }

    return Result<IndexConfig>::ok(IndexConfig::effective(global, local));
}

static Status run(int argc, char** argv) {
    if (argc < 2) {
        return IndexError{IndexError::InvalidArg,
            "no package name specified",
            "usage: demo_query <package> [config.toml] [--update]"};
    }

    auto name = PackageName::parse(argv[1]);
    PKGINDEX_TRY(name);

    auto config = load_config(argc, argv);
    PKGINDEX_TRY(config);
    log::set_level(config.value().log_level);

    SubprocessRunner runner(config.value().git_timeout);
    CurlHttpClient http;
    IndexManager manager(config.value(), runner, http,
                         ToolLocator::from_environment());

    auto index = manager.ensure();
    PKGINDEX_TRY(index);

    if (argc >= 4 && std::string(argv[3]) == "--update") {
        PKGINDEX_TRY(manager.update(index.value()));
    }

    auto versions = manager.versions(index.value(), name.value());
    PKGINDEX_TRY(versions);

    if (!versions.value()) {
        std::cout << name.value().str() << ": no versions in the index\n";
        return ok_status();
    }
    std::cout << name.value().str() << ":";
    for (const auto& v : *versions.value()) {
        std::cout << " " << v.to_string();
    }
    std::cout << "\n";
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
