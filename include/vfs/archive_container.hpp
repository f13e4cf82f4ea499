//! # Archive Containers
//!
//! A read-only container over a zip, jar or war archive, read through
//! minizip. Entries are indexed when the container is opened; entry data is
//! read and inflated on demand. The archive stays open for the lifetime of
//! the container and is closed by `close()` or the destructor.

#pragma once

#include "vfs/container.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <set>

namespace jig::vfs {

/// Index record for one file entry of an archive.
struct ArchiveEntry {
    std::string original_name;   ///< Name as stored in the archive
    uint64_t size = 0;           ///< Uncompressed size recorded in the directory
    uint64_t directory_pos = 0;  ///< minizip position of the central directory record
    uint64_t file_number = 0;    ///< Index of the entry in the central directory
    unsigned long method = 0;    ///< Compression method (0 stored, 8 deflated)
    bool encrypted = false;
};

class ArchiveContainer : public Container {
public:
    /// Opens and indexes `archive`. Throws `BackingStoreError` if the file
    /// cannot be opened or is not a zip archive.
    explicit ArchiveContainer(const std::filesystem::path& archive);
    ~ArchiveContainer() override;

    const std::filesystem::path& archive_path() const {
        return archive_path_;
    }

    /// Number of file entries.
    size_t entry_count() const {
        return entries_.size();
    }

    bool exists(std::string_view path) const override;
    bool is_directory(std::string_view path) const override;

    /// Reads and inflates an entry. Encrypted entries and methods other than
    /// stored and deflated are `Unsupported`; checksum or size mismatches are
    /// `Corrupt`.
    std::optional<Bytes> read(std::string_view path) const override;

    /// Always throws `UsageError`: archives are read-only.
    FileHandle write(std::string_view path, const Bytes& contents) override;

    std::vector<std::string> list_all() const override;

protected:
    void do_close() override;

private:
    std::filesystem::path archive_path_;
    void* zip_handle_ = nullptr; // unzFile from minizip

    std::map<std::string, ArchiveEntry> entries_;
    std::set<std::string> directories_;

    mutable std::mutex zip_mutex_;
};

} // namespace jig::vfs
