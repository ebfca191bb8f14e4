#pragma once

#include <pkgindex/result.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct archive;

namespace pkgindex {

// Decompress the gzip stream in `src` into `dst`, truncating `dst` first.
// Input that is not gzip, or a truncated stream, is IndexCorrupt.
Status gunzip_file(const std::string& src, const std::string& dst);

struct TarEntry {
    std::string path;
    int64_t size = 0;
    bool regular = false;
};

// Forward-only reader over the entries of an uncompressed tar file.
// Entry data is read through and discarded; a short entry is IndexCorrupt.
// Once next() has returned nullopt or an error the reader stays exhausted.
class TarReader {
public:
    TarReader();
    ~TarReader();

    TarReader(const TarReader&) = delete;
    TarReader& operator=(const TarReader&) = delete;

    // IO if the file cannot be read, IndexCorrupt if it is not a tar
    Status open(const std::string& path);

    // Next entry, nullopt at end of archive, IndexCorrupt on decode failure
    Result<std::optional<TarEntry>> next();

    const std::string& path() const { return path_; }

private:
    struct ArchiveDeleter {
        void operator()(struct archive* a) const;
    };

    IndexError corrupt(const std::string& what) const;
    Status drain_pending();

    std::unique_ptr<struct archive, ArchiveDeleter> archive_;
    std::string path_;
    bool done_ = false;
    int64_t pending_size_ = -1;  // data bytes owed by the last regular entry
};

} // namespace pkgindex
