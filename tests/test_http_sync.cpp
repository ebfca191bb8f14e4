#include <catch2/catch.hpp>
#include <pkgindex/log.hpp>
#include <pkgindex/sync.hpp>
#include "test_support.hpp"

using namespace pkgindex;
using namespace pkgindex::testing;

namespace {

struct HttpFixture {
    TempDir td;
    IndexConfig config = IndexConfig::defaults();
    FakeHttpClient http;
    std::string plain_tar;

    HttpFixture() {
        config.root = (td.path / "root").string();
        config.http_url = "https://mirror.example.com/00-index.tar.gz";
        fs::create_directories(td.path / "mirror");

        write_tar(td.path / "fixture.tar", sample_index());
        plain_tar = read_file(td.path / "fixture.tar");
        write_gzip(td.path / "fixture.tar.gz", plain_tar);
        http.body = read_file(td.path / "fixture.tar.gz");
    }

    PackageIndex index() const {
        return try_get_index((td.path / "mirror").string()).value();
    }
};

// Captures warnings for the duration of a test
struct SinkCapture {
    std::vector<std::pair<log::Level, std::string>> lines;
    SinkCapture() {
        log::set_sink([this](log::Level l, const std::string& msg) {
            lines.emplace_back(l, msg);
        });
    }
    ~SinkCapture() { log::reset_sink(); }

    bool has(log::Level l, const std::string& needle) const {
        for (const auto& [lvl, msg] : lines) {
            if (lvl == l && msg.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

} // namespace

TEST_CASE("200 response replaces the mirror files", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.http.headers = {{"ETag", "\"v2-abc\""}};

    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());

    REQUIRE(f.http.requests.size() == 1);
    REQUIRE(f.http.requests[0].url == f.config.http_url);
    REQUIRE(read_file(idx.etag_path()) == "\"v2-abc\"");
    REQUIRE(read_file(idx.tar_path()) == f.plain_tar);
    REQUIRE(read_file(idx.tar_gz_path()) == f.http.body);
    REQUIRE_FALSE(fs::exists(idx.tmp_path()));
}

TEST_CASE("first download sends no If-None-Match", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE_FALSE(f.http.request_header(0, "If-None-Match").has_value());
}

TEST_CASE("cached etag is sent back", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.td.write_file("mirror/00-index.tar.gz.etag", "\"v1\"");
    f.http.status = 304;
    f.http.body.clear();

    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE(f.http.request_header(0, "If-None-Match") == std::optional<std::string>("\"v1\""));
}

TEST_CASE("etag longer than the cap is truncated", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.td.write_file("mirror/00-index.tar.gz.etag", std::string(2000, 'e'));
    f.http.status = 304;
    f.http.body.clear();

    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    auto sent = f.http.request_header(0, "If-None-Match");
    REQUIRE(sent.has_value());
    REQUIRE(sent->size() == HttpIndexSync::kMaxEtagBytes);
}

TEST_CASE("304 leaves every mirror file unchanged", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.td.write_file("mirror/00-index.tar", "old tar");
    f.td.write_file("mirror/00-index.tar.gz", "old gz");
    f.td.write_file("mirror/00-index.tar.gz.etag", "\"v1\"");
    f.http.status = 304;
    f.http.headers = {{"ETag", "\"v2\""}};
    f.http.body.clear();

    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE(read_file(idx.tar_path()) == "old tar");
    REQUIRE(read_file(idx.tar_gz_path()) == "old gz");
    REQUIRE(read_file(idx.etag_path()) == "\"v1\"");
    REQUIRE_FALSE(fs::exists(idx.tmp_path()));
}

TEST_CASE("error statuses are not failures and change nothing", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.td.write_file("mirror/00-index.tar", "old tar");
    f.http.status = 404;
    f.http.body = "not found";

    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE(read_file(idx.tar_path()) == "old tar");
    REQUIRE_FALSE(fs::exists(idx.tar_gz_path()));
    REQUIRE_FALSE(fs::exists(idx.etag_path()));
}

TEST_CASE("200 without ETag keeps the old etag file", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.td.write_file("mirror/00-index.tar.gz.etag", "\"v1\"");

    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE(read_file(idx.etag_path()) == "\"v1\"");
    REQUIRE(read_file(idx.tar_path()) == f.plain_tar);
}

TEST_CASE("non-gzip body is IndexCorrupt", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.td.write_file("mirror/00-index.tar", "old tar");
    f.http.body = "<html>captive portal</html>";

    HttpIndexSync sync(f.config, f.http);
    auto s = sync.sync(idx);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == IndexError::IndexCorrupt);
    REQUIRE(read_file(idx.tar_path()) == "old tar");
    REQUIRE_FALSE(fs::exists(idx.tar_gz_path()));
}

TEST_CASE("transport failure propagates", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.http.failure = IndexError{IndexError::Network, "Could not resolve host"};

    HttpIndexSync sync(f.config, f.http);
    auto s = sync.sync(idx);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == IndexError::Network);
    REQUIRE_FALSE(fs::exists(idx.tar_path()));
    REQUIRE_FALSE(fs::exists(idx.tmp_path()));
}

TEST_CASE("interrupted body leaves the tar untouched", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.td.write_file("mirror/00-index.tar", "old tar");
    f.http.failure = IndexError{IndexError::Timeout, "Operation timed out"};
    f.http.fail_after_begin = true;

    HttpIndexSync sync(f.config, f.http);
    auto s = sync.sync(idx);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == IndexError::Timeout);
    REQUIRE(read_file(idx.tar_path()) == "old tar");
    REQUIRE_FALSE(fs::exists(idx.tar_gz_path()));
}

TEST_CASE("http timeout is passed through", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.config.http_timeout = 42;
    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE(f.http.requests[0].timeout_seconds == 42);
}

TEST_CASE("signature verification over http only warns", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    f.config.verify_signatures = true;
    log::set_level(log::Info);

    SinkCapture cap;
    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE(cap.has(log::Warn, "GPG verification only works with Git"));
    REQUIRE(read_file(idx.tar_path()) == f.plain_tar);
}

TEST_CASE("no warning without signature verification", "[http-sync]") {
    HttpFixture f;
    auto idx = f.index();
    log::set_level(log::Info);

    SinkCapture cap;
    HttpIndexSync sync(f.config, f.http);
    REQUIRE(sync.sync(idx).is_ok());
    REQUIRE_FALSE(cap.has(log::Warn, "GPG"));
    REQUIRE(cap.has(log::Info, "Updated package index from"));
}
