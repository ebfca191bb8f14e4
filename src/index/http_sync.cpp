#include <pkgindex/sync.hpp>
#include <pkgindex/archive.hpp>
#include <pkgindex/log.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace pkgindex {

namespace {

// Writes a 200 response into the mirror. Other statuses leave every file
// untouched.
//
// Order on 200: etag file, body -> .tmp, gunzip .tmp -> 00-index.tar,
// rename .tmp -> 00-index.tar.gz. The etag and the tar are replaced in
// place, so an interrupted refresh can leave them out of step with the
// compressed copy.
class IndexDownload : public ResponseHandler {
public:
    explicit IndexDownload(const PackageIndex& index) : index_(index) {}

    Status begin(const HttpResponse& head) override {
        if (head.status != 200) {
            log::debug("Package index not refreshed (HTTP %ld)", head.status);
            return ok_status();
        }
        active_ = true;

        if (auto etag = head.header("ETag")) {
            std::ofstream f(index_.etag_path(), std::ios::binary | std::ios::trunc);
            f << *etag;
            f.close();
            if (!f) {
                return IndexError{IndexError::IO,
                    "cannot write " + index_.etag_path()};
            }
        }

        tmp_.open(index_.tmp_path(), std::ios::binary | std::ios::trunc);
        if (!tmp_) {
            return IndexError{IndexError::IO,
                "cannot create " + index_.tmp_path()};
        }
        return ok_status();
    }

    Status write(const char* data, size_t size) override {
        if (!active_) return ok_status();
        tmp_.write(data, static_cast<std::streamsize>(size));
        if (!tmp_) {
            return IndexError{IndexError::IO,
                "write failed: " + index_.tmp_path()};
        }
        return ok_status();
    }

    Status finish() override {
        if (!active_) return ok_status();

        tmp_.close();
        if (!tmp_) {
            return IndexError{IndexError::IO,
                "write failed: " + index_.tmp_path()};
        }

        PKGINDEX_TRY(gunzip_file(index_.tmp_path(), index_.tar_path()));

        std::error_code ec;
        fs::rename(index_.tmp_path(), index_.tar_gz_path(), ec);
        if (ec) {
            return IndexError{IndexError::IO,
                "cannot rename " + index_.tmp_path() + " to " +
                index_.tar_gz_path() + ": " + ec.message()};
        }
        updated_ = true;
        return ok_status();
    }

    bool updated() const { return updated_; }

private:
    const PackageIndex& index_;
    std::ofstream tmp_;
    bool active_ = false;
    bool updated_ = false;
};

Result<std::optional<std::string>> read_etag(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return IndexError{IndexError::IO, "cannot read " + path};
    }
    std::string etag(HttpIndexSync::kMaxEtagBytes, '\0');
    f.read(&etag[0], static_cast<std::streamsize>(etag.size()));
    etag.resize(static_cast<size_t>(f.gcount()));
    return Result<std::optional<std::string>>::ok(std::move(etag));
}

} // namespace

Status HttpIndexSync::sync(const PackageIndex& index) {
    HttpRequest req;
    req.url = config_.http_url;
    req.timeout_seconds = config_.http_timeout;

    if (config_.verify_signatures) {
        log::warn("You have enabled GPG verification of the package index, "
                  "but GPG verification only works with Git downloading");
    }
    log::debug("Downloading package index from %s", req.url.c_str());

    auto etag = read_etag(index.etag_path());
    if (etag.is_err()) return std::move(etag).error();
    if (etag.value()) {
        req.headers.emplace_back("If-None-Match", *etag.value());
    }

    IndexDownload download(index);
    auto res = http_.get(req, download);
    if (res.is_err()) return std::move(res).error();

    if (download.updated()) {
        log::info("Updated package index from %s", req.url.c_str());
    }
    return ok_status();
}

} // namespace pkgindex
