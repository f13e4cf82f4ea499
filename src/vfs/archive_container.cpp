//! # Archive Containers Implementation

#include "vfs/archive_container.hpp"

#include "log/log.hpp"
#include "vfs/errors.hpp"

#include <minizip/unzip.h>

namespace jig::vfs {

namespace fs = std::filesystem;

namespace {

constexpr unsigned long METHOD_STORED = 0;
constexpr unsigned long METHOD_DEFLATED = 8;
constexpr unsigned long FLAG_ENCRYPTED = 0x0001;

constexpr unsigned READ_CHUNK_SIZE = 64 * 1024;

unzFile as_unz(void* handle) {
    return static_cast<unzFile>(handle);
}

fs::path absolute_archive(const fs::path& archive) {
    std::error_code ec;
    auto absolute = fs::absolute(archive, ec);
    return ec ? archive : absolute.lexically_normal();
}

std::string minizip_error(std::string_view what, int rc) {
    return std::string(what) + " (minizip error " + std::to_string(rc) + ")";
}

/// Walks the central directory, recording every entry in archive order.
Result<std::vector<ArchiveEntry>, VfsError> index_entries(unzFile zip) {
    std::vector<ArchiveEntry> entries;

    int rc = unzGoToFirstFile(zip);
    while (rc == UNZ_OK) {
        unz_file_info64 info;
        rc = unzGetCurrentFileInfo64(zip, &info, nullptr, 0, nullptr, 0, nullptr, 0);
        if (rc != UNZ_OK) {
            break;
        }

        std::string name(info.size_filename, '\0');
        rc = unzGetCurrentFileInfo64(zip, &info, name.data(), static_cast<uLong>(name.size()),
                                     nullptr, 0, nullptr, 0);
        if (rc != UNZ_OK) {
            break;
        }

        unz64_file_pos position;
        rc = unzGetFilePos64(zip, &position);
        if (rc != UNZ_OK) {
            break;
        }

        ArchiveEntry entry;
        entry.original_name = std::move(name);
        entry.size = info.uncompressed_size;
        entry.directory_pos = position.pos_in_zip_directory;
        entry.file_number = position.num_of_file;
        entry.method = info.compression_method;
        entry.encrypted = (info.flag & FLAG_ENCRYPTED) != 0;
        entries.push_back(std::move(entry));

        rc = unzGoToNextFile(zip);
    }

    if (rc != UNZ_END_OF_LIST_OF_FILE) {
        return VfsError::corrupt(minizip_error("cannot read central directory", rc), "");
    }
    return entries;
}

/// Reads one entry. Output grows with the data actually inflated and never
/// past the size recorded in the central directory.
Result<Bytes, VfsError> read_entry(unzFile zip, const ArchiveEntry& entry) {
    if (entry.encrypted) {
        return VfsError::unsupported("encrypted entries are not supported", "");
    }
    if (entry.method != METHOD_STORED && entry.method != METHOD_DEFLATED) {
        return VfsError::unsupported(
            "compression method " + std::to_string(entry.method) + " is not supported", "");
    }

    unz64_file_pos position;
    position.pos_in_zip_directory = entry.directory_pos;
    position.num_of_file = entry.file_number;
    int rc = unzGoToFilePos64(zip, &position);
    if (rc != UNZ_OK) {
        return VfsError::corrupt(minizip_error("cannot locate entry", rc), "");
    }

    rc = unzOpenCurrentFile(zip);
    if (rc != UNZ_OK) {
        return VfsError::corrupt(minizip_error("cannot open entry", rc), "");
    }

    Bytes output;
    Bytes chunk(READ_CHUNK_SIZE);
    bool oversized = false;
    int read = 0;
    while ((read = unzReadCurrentFile(zip, chunk.data(), READ_CHUNK_SIZE)) > 0) {
        auto count = static_cast<size_t>(read);
        if (output.size() + count > entry.size) {
            oversized = true;
            break;
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + read);
    }

    int close_rc = unzCloseCurrentFile(zip);
    if (oversized) {
        return VfsError::corrupt("entry data exceeds its recorded size of " +
                                     std::to_string(entry.size) + " bytes",
                                 "");
    }
    if (read < 0) {
        return VfsError::corrupt(minizip_error("cannot inflate entry", read), "");
    }
    if (close_rc == UNZ_CRCERROR) {
        return VfsError::corrupt("CRC-32 mismatch", "");
    }
    if (close_rc != UNZ_OK) {
        return VfsError::corrupt(minizip_error("cannot finish entry", close_rc), "");
    }
    if (output.size() != entry.size) {
        return VfsError::corrupt("entry holds " + std::to_string(output.size()) +
                                     " bytes, directory records " + std::to_string(entry.size),
                                 "");
    }
    return output;
}

} // namespace

ArchiveContainer::ArchiveContainer(const fs::path& archive)
    : Container(absolute_archive(archive).string(), archive.filename().string(),
                ContainerKind::Archive, Capabilities{true, false}),
      archive_path_(absolute_archive(archive)) {
    std::error_code ec;
    if (!fs::is_regular_file(archive_path_, ec)) {
        throw BackingStoreError(VfsError::io("cannot open archive", archive_path_.string()));
    }

    zip_handle_ = unzOpen64(archive_path_.c_str());
    if (zip_handle_ == nullptr) {
        throw BackingStoreError(VfsError::corrupt("not a zip archive", archive_path_.string()));
    }

    auto indexed = index_entries(as_unz(zip_handle_));
    if (is_err(indexed)) {
        auto error = unwrap_err(indexed);
        error.path = archive_path_.string();
        int rc = unzClose(as_unz(zip_handle_));
        zip_handle_ = nullptr;
        if (rc != UNZ_OK) {
            JIG_LOG_WARN("archive", "Closing unreadable archive " << archive_path_.string()
                                                                  << " failed with " << rc);
        }
        throw BackingStoreError(std::move(error));
    }

    for (auto& entry : unwrap(indexed)) {
        auto normalized = normalize_relative_path(entry.original_name);
        if (!normalized) {
            JIG_LOG_DEBUG("archive", "Skipping entry " << entry.original_name << " in " << name());
            continue;
        }
        for (auto parent = parent_of(*normalized); !parent.empty(); parent = parent_of(parent)) {
            directories_.emplace(parent);
        }
        if (entry.original_name.back() == '/') {
            directories_.insert(*normalized);
            continue;
        }
        if (entry.encrypted) {
            JIG_LOG_WARN("archive", "Entry " << entry.original_name << " in " << name()
                                             << " is encrypted and cannot be read");
        }
        // First occurrence of a duplicated name wins, as in group precedence.
        if (!entries_.emplace(*normalized, std::move(entry)).second) {
            JIG_LOG_DEBUG("archive", "Ignoring duplicate entry " << *normalized << " in "
                                                                 << name());
        }
    }

    JIG_LOG_DEBUG("archive", "Indexed " << entries_.size() << " entries in "
                                        << archive_path_.string());
}

ArchiveContainer::~ArchiveContainer() {
    close_on_destruction();
}

bool ArchiveContainer::exists(std::string_view path) const {
    ensure_open("check existence");
    auto normalized = normalize_relative_path(path);
    return normalized && entries_.count(*normalized) > 0;
}

bool ArchiveContainer::is_directory(std::string_view path) const {
    ensure_open("check directory");
    auto normalized = normalize_relative_path(path);
    return normalized && directories_.count(*normalized) > 0;
}

std::optional<Bytes> ArchiveContainer::read(std::string_view path) const {
    ensure_open("read");
    auto normalized = normalize_relative_path(path);
    if (!normalized) {
        return std::nullopt;
    }

    auto it = entries_.find(*normalized);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(zip_mutex_);
    ensure_open("read");
    auto data = read_entry(as_unz(zip_handle_), it->second);
    if (is_err(data)) {
        auto error = unwrap_err(data);
        error.path = archive_path_.string() + "!/" + *normalized;
        throw BackingStoreError(std::move(error));
    }
    return std::move(unwrap(data));
}

FileHandle ArchiveContainer::write(std::string_view path, const Bytes& /*contents*/) {
    prepare_write(path);
    // prepare_write always rejects read-only containers.
    throw UsageError("archive " + name() + " is read-only");
}

std::vector<std::string> ArchiveContainer::list_all() const {
    ensure_open("list files");
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [path, _] : entries_) {
        result.push_back(path);
    }
    return result;
}

void ArchiveContainer::do_close() {
    std::lock_guard<std::mutex> lock(zip_mutex_);
    if (zip_handle_ == nullptr) {
        return;
    }
    int rc = unzClose(as_unz(zip_handle_));
    zip_handle_ = nullptr;
    if (rc != UNZ_OK) {
        throw BackingStoreError(
            VfsError::io(minizip_error("cannot close archive", rc), archive_path_.string()));
    }
    JIG_LOG_DEBUG("archive", "Closed " << archive_path_.string());
}

} // namespace jig::vfs
