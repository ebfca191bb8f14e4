#include <pkgindex/archive.hpp>
#include <pkgindex/log.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace pkgindex {

namespace {

struct ReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};
using ArchiveReadHandle = std::unique_ptr<struct archive, ReadDeleter>;

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown archive error";
}

} // namespace

// ---------------------------------------------------------------------------
// gzip
// ---------------------------------------------------------------------------

Status gunzip_file(const std::string& src, const std::string& dst) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        return IndexError{IndexError::IO, "archive_read_new failed"};
    }
    archive_read_support_filter_gzip(a.get());
    archive_read_support_format_raw(a.get());

    if (archive_read_open_filename(a.get(), src.c_str(), 65536) != ARCHIVE_OK) {
        return IndexError{IndexError::IO,
            "cannot open " + src + ": " + archive_message(a.get())};
    }

    struct archive_entry* entry = nullptr;
    int r = archive_read_next_header(a.get(), &entry);
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
        return IndexError{IndexError::IndexCorrupt,
            "cannot decompress: " + archive_message(a.get()),
            "", src};
    }
    // The raw format accepts anything through the pass-through filter
    if (archive_filter_code(a.get(), 0) != ARCHIVE_FILTER_GZIP) {
        return IndexError{IndexError::IndexCorrupt,
            "not a gzip stream", "", src};
    }

    std::ofstream out(dst, std::ios::binary | std::ios::trunc);
    if (!out) {
        return IndexError{IndexError::IO, "cannot create " + dst};
    }

    char buf[65536];
    la_ssize_t n;
    while ((n = archive_read_data(a.get(), buf, sizeof(buf))) > 0) {
        out.write(buf, static_cast<std::streamsize>(n));
        if (!out) {
            return IndexError{IndexError::IO, "write failed: " + dst};
        }
    }
    if (n < 0) {
        return IndexError{IndexError::IndexCorrupt,
            "cannot decompress: " + archive_message(a.get()),
            "", src};
    }

    out.close();
    if (!out) {
        return IndexError{IndexError::IO, "write failed: " + dst};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// TarReader
// ---------------------------------------------------------------------------

void TarReader::ArchiveDeleter::operator()(struct archive* a) const {
    ReadDeleter{}(a);
}

TarReader::TarReader() = default;
TarReader::~TarReader() = default;

IndexError TarReader::corrupt(const std::string& what) const {
    return IndexError{IndexError::IndexCorrupt,
        "cannot read index tarball: " + what,
        "delete the file and update the index",
        path_};
}

Status TarReader::open(const std::string& path) {
    path_ = path;
    done_ = true;
    pending_size_ = -1;
    archive_.reset();

    // Only an unreadable file is IO; anything libarchive refuses is corrupt
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ::access(path.c_str(), R_OK) != 0) {
        return IndexError{IndexError::IO, "cannot open " + path,
                          "", path};
    }

    archive_.reset(archive_read_new());
    if (!archive_) {
        return IndexError{IndexError::IO, "archive_read_new failed"};
    }
    archive_read_support_format_tar(archive_.get());

    if (archive_read_open_filename(archive_.get(), path.c_str(), 65536) != ARCHIVE_OK) {
        IndexError e = corrupt(archive_message(archive_.get()));
        archive_.reset();
        return e;
    }
    done_ = false;
    return ok_status();
}

Status TarReader::drain_pending() {
    if (pending_size_ < 0) return ok_status();
    int64_t expected = pending_size_;
    pending_size_ = -1;

    char buf[16384];
    int64_t total = 0;
    la_ssize_t n;
    while ((n = archive_read_data(archive_.get(), buf, sizeof(buf))) > 0) {
        total += n;
    }
    if (n < 0) {
        return corrupt(archive_message(archive_.get()));
    }
    if (total < expected) {
        return corrupt("entry data truncated (" + std::to_string(total) +
                       " of " + std::to_string(expected) + " bytes)");
    }
    return ok_status();
}

Result<std::optional<TarEntry>> TarReader::next() {
    if (done_ || !archive_) {
        return Result<std::optional<TarEntry>>::ok(std::nullopt);
    }

    // The previous entry's data must be complete before the next header
    auto drained = drain_pending();
    if (drained.is_err()) {
        done_ = true;
        return std::move(drained).error();
    }

    struct archive_entry* entry = nullptr;
    int r = archive_read_next_header(archive_.get(), &entry);

    if (r == ARCHIVE_EOF) {
        done_ = true;
        return Result<std::optional<TarEntry>>::ok(std::nullopt);
    }
    if (r == ARCHIVE_WARN) {
        log::debug("%s: %s", path_.c_str(), archive_message(archive_.get()).c_str());
    } else if (r != ARCHIVE_OK) {
        done_ = true;
        return corrupt(archive_message(archive_.get()));
    }

    TarEntry e;
    const char* name = archive_entry_pathname(entry);
    e.path = name ? name : "";
    e.size = archive_entry_size(entry);
    e.regular = archive_entry_filetype(entry) == AE_IFREG;
    if (e.regular) {
        pending_size_ = archive_entry_size_is_set(entry) ? e.size : 0;
    }
    return Result<std::optional<TarEntry>>::ok(std::move(e));
}

} // namespace pkgindex
