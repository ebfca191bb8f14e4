#include <catch2/catch.hpp>
#include <pkgindex/sync.hpp>
#include "test_support.hpp"

#include <sys/stat.h>

using namespace pkgindex;
using namespace pkgindex::testing;

namespace {

// Scratch root, mirror directory and a search path holding a fake git
struct GitFixture {
    TempDir td;
    IndexConfig config = IndexConfig::defaults();
    FakeRunner runner;
    fs::path mirror;
    fs::path bin;

    GitFixture() {
        config.root = (td.path / "root").string();
        config.git_url = "https://example.com/org/all-cabal-hashes.git";
        mirror = td.path / "mirror";
        bin = td.path / "bin";
        td.write_file("bin/git", "#!/bin/sh\nexit 0\n");
        chmod((bin / "git").c_str(), 0755);

        // Behave like git: clone creates the directory, archive writes the tar
        runner.handler = [this](const RecordedCommand& c) {
            if (c.args.at(0) == "clone") {
                fs::create_directories(fs::path(c.working_dir) / c.args.at(2));
            } else if (c.args.at(0) == "archive") {
                write_tar(c.args.at(3), sample_index());
            }
            return Result<CommandResult>::ok(CommandResult{0, "", ""});
        };
    }

    ToolLocator locator() const { return ToolLocator(bin.string()); }

    fs::path clone_dir() const {
        return fs::path(config.root) / "update" / "all-cabal-hashes";
    }

    PackageIndex index() {
        fs::create_directories(mirror);
        return try_get_index(mirror.string()).value();
    }
};

} // namespace

TEST_CASE("first git sync clones, fetches and exports", "[git-sync]") {
    GitFixture f;
    auto idx = f.index();
    GitIndexSync sync(f.config, f.runner, f.locator());

    auto s = sync.sync(idx);
    REQUIRE(s.is_ok());

    REQUIRE((f.runner.subcommands() ==
             std::vector<std::string>{"clone", "fetch", "archive"}));

    const auto& clone = f.runner.calls[0];
    REQUIRE(clone.executable == (f.bin / "git").string());
    REQUIRE((clone.args == std::vector<std::string>{
        "clone", "https://example.com/org/all-cabal-hashes.git",
        "all-cabal-hashes", "--depth", "1", "-b", "display"}));
    REQUIRE(clone.working_dir == (fs::path(f.config.root) / "update").string());

    REQUIRE(f.runner.calls[1].working_dir == f.clone_dir().string());
    REQUIRE((f.runner.calls[2].args == std::vector<std::string>{
        "archive", "--format=tar", "-o", idx.tar_path(), "current-hackage"}));
    REQUIRE(fs::exists(idx.tar_path()));
}

TEST_CASE("existing clone is fetched, not re-cloned", "[git-sync]") {
    GitFixture f;
    fs::create_directories(f.clone_dir());
    auto idx = f.index();
    GitIndexSync sync(f.config, f.runner, f.locator());

    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE((f.runner.subcommands() == std::vector<std::string>{"fetch", "archive"}));
}

TEST_CASE("git sync creates a missing mirror directory", "[git-sync]") {
    GitFixture f;
    fs::create_directories(f.mirror);
    auto idx = try_get_index(f.mirror.string()).value();
    fs::remove_all(f.mirror);

    GitIndexSync sync(f.config, f.runner, f.locator());
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE(fs::is_directory(f.mirror));
}

TEST_CASE("signature verification runs before export", "[git-sync]") {
    GitFixture f;
    f.config.verify_signatures = true;
    auto idx = f.index();
    GitIndexSync sync(f.config, f.runner, f.locator());

    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE((f.runner.subcommands() ==
             std::vector<std::string>{"clone", "fetch", "tag", "archive"}));
    REQUIRE((f.runner.calls[2].args ==
             std::vector<std::string>{"tag", "-v", "current-hackage"}));
}

TEST_CASE("failed verification aborts without exporting", "[git-sync]") {
    GitFixture f;
    f.config.verify_signatures = true;
    auto idx = f.index();
    write_tar(idx.tar_path(), sample_index());

    auto base = f.runner.handler;
    f.runner.handler = [base](const RecordedCommand& c) {
        if (c.args.at(0) == "tag") {
            return Result<CommandResult>::ok(CommandResult{1, "", "gpg: BAD signature"});
        }
        return base(c);
    };
    GitIndexSync sync(f.config, f.runner, f.locator());

    auto s = sync.sync(idx);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == IndexError::Signature);
    REQUIRE(s.error().hint.find("D6CF60FD") != std::string::npos);
    REQUIRE(s.error().hint.find("https://github.com/fpco/stackage-update#readme")
            != std::string::npos);
    REQUIRE((f.runner.subcommands() ==
             std::vector<std::string>{"clone", "fetch", "tag"}));
    // The stale archive was removed and nothing replaced it
    REQUIRE_FALSE(fs::exists(idx.tar_path()));
}

TEST_CASE("verification is skipped when disabled", "[git-sync]") {
    GitFixture f;
    auto idx = f.index();
    GitIndexSync sync(f.config, f.runner, f.locator());
    REQUIRE(sync.sync(idx).is_ok());
    for (const auto& c : f.runner.calls) REQUIRE(c.args.at(0) != "tag");
}

TEST_CASE("missing git is ToolMissing and touches no mirror files", "[git-sync]") {
    GitFixture f;
    auto idx = f.index();
    write_tar(idx.tar_path(), sample_index());
    f.td.write_file("mirror/00-index.tar.gz.etag", "\"abc\"");
    auto tar_before = read_file(idx.tar_path());

    GitIndexSync sync(f.config, f.runner, ToolLocator((f.td.path / "nobin").string()));
    auto s = sync.sync(idx);

    REQUIRE(s.is_err());
    REQUIRE(s.error().code == IndexError::ToolMissing);
    REQUIRE(s.error().hint.find("install git") != std::string::npos);
    REQUIRE(f.runner.calls.empty());
    REQUIRE(read_file(idx.tar_path()) == tar_before);
    REQUIRE(read_file(idx.etag_path()) == "\"abc\"");
    REQUIRE_FALSE(fs::exists(fs::path(f.config.root) / "update"));
}

TEST_CASE("failed fetch surfaces as Subprocess and keeps the clone", "[git-sync]") {
    GitFixture f;
    auto idx = f.index();
    auto base = f.runner.handler;
    f.runner.handler = [base](const RecordedCommand& c) {
        if (c.args.at(0) == "fetch") {
            return Result<CommandResult>::ok(CommandResult{128, "", "fatal: unable to access"});
        }
        return base(c);
    };
    GitIndexSync sync(f.config, f.runner, f.locator());

    auto s = sync.sync(idx);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == IndexError::Subprocess);
    REQUIRE(s.error().message.find("unable to access") != std::string::npos);
    REQUIRE(fs::is_directory(f.clone_dir()));

    // The retry reuses the clone
    f.runner.calls.clear();
    f.runner.handler = base;
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE((f.runner.subcommands() == std::vector<std::string>{"fetch", "archive"}));
}

TEST_CASE("failed export surfaces as Subprocess", "[git-sync]") {
    GitFixture f;
    auto idx = f.index();
    f.runner.handler = [](const RecordedCommand& c) {
        if (c.args.at(0) == "clone") {
            fs::create_directories(fs::path(c.working_dir) / c.args.at(2));
        }
        int code = c.args.at(0) == "archive" ? 128 : 0;
        return Result<CommandResult>::ok(
            CommandResult{code, "", code ? "fatal: not a valid object name" : ""});
    };
    GitIndexSync sync(f.config, f.runner, f.locator());

    auto s = sync.sync(idx);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == IndexError::Subprocess);
    REQUIRE_FALSE(fs::exists(idx.tar_path()));
}

TEST_CASE("clone path derives from the git url", "[git-sync]") {
    GitFixture f;
    GitIndexSync sync(f.config, f.runner, f.locator());
    REQUIRE(sync.clone_path().value() == f.clone_dir().string());
}

// ===== Transport selection =====

TEST_CASE("git on the search path selects the git transport", "[git-sync]") {
    GitFixture f;
    REQUIRE(select_transport(f.locator()) == Transport::Git);
    REQUIRE(select_transport(ToolLocator((f.td.path / "nobin").string())) == Transport::Http);
    REQUIRE(std::string(transport_name(Transport::Git)) == "git");
    REQUIRE(std::string(transport_name(Transport::Http)) == "http");
}
