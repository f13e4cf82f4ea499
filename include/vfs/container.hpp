//! # Containers
//!
//! A `Container` is one backing store overlaid onto a location: a real
//! directory, a zip/jar archive, or an in-memory tree. All paths are
//! relative to the container root and normalized with
//! `normalize_relative_path`; a path that fails normalization is simply
//! not found.
//!
//! ## Lifecycle
//!
//! Containers are owned by exactly one `ContainerGroup`. `close()` releases
//! the backing resource (archive handle, owned temp directory, memory) and
//! is idempotent. Using a closed container throws `UsageError`.
//!
//! ## Failures
//!
//! | Operation   | Missing path | I/O failure         | Misuse       |
//! |-------------|--------------|---------------------|--------------|
//! | exists      | false        | `BackingStoreError` | `UsageError` |
//! | read        | nullopt      | `BackingStoreError` | `UsageError` |
//! | write       | created      | `BackingStoreError` | `UsageError` |

#pragma once

#include "common.hpp"
#include "vfs/file_handle.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jig::vfs {

enum class ContainerKind { Directory, Archive, Memory };

/// Returns "directory", "archive" or "memory".
const char* container_kind_name(ContainerKind kind);

struct Capabilities {
    bool readable = true;
    bool writable = false;
};

class Container {
public:
    virtual ~Container() = default;

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    /// Unique identity of the backing root (absolute path, archive path or
    /// a generated memory id).
    const std::string& root_id() const {
        return root_id_;
    }

    /// Short human-readable name used in messages and tree dumps.
    const std::string& name() const {
        return name_;
    }

    ContainerKind kind() const {
        return kind_;
    }

    Capabilities capabilities() const {
        return capabilities_;
    }

    bool is_writable() const {
        return capabilities_.writable;
    }

    /// True if a regular file exists at `path`.
    virtual bool exists(std::string_view path) const = 0;

    /// True if `path` names a directory inside the container.
    virtual bool is_directory(std::string_view path) const = 0;

    /// Full contents of the file at `path`.
    virtual std::optional<Bytes> read(std::string_view path) const = 0;

    /// Creates or replaces the file at `path`, creating intermediate
    /// directories. Throws `UsageError` for read-only containers and
    /// invalid paths.
    virtual FileHandle write(std::string_view path, const Bytes& contents) = 0;

    /// Every regular file, as sorted normalized relative paths.
    virtual std::vector<std::string> list_all() const = 0;

    /// Handle for `path` if the file exists.
    std::optional<FileHandle> find(std::string_view path) const;

    /// Convenience for text content.
    FileHandle write_text(std::string_view path, std::string_view text) {
        return write(path, to_bytes(text));
    }

    /// Releases the backing resource. Idempotent.
    void close();

    bool is_closed() const {
        return closed_.load(std::memory_order_acquire);
    }

protected:
    Container(std::string root_id, std::string name, ContainerKind kind, Capabilities capabilities);

    /// Backend-specific release. Called at most once.
    virtual void do_close() = 0;

    /// Throws `UsageError` naming `operation` if the container is closed.
    void ensure_open(std::string_view operation) const;

    /// Normalizes `path` for a write, throwing `UsageError` if it is invalid
    /// or the container is read-only.
    std::string prepare_write(std::string_view path) const;

    /// Closes from a destructor, logging failures instead of throwing.
    void close_on_destruction() noexcept;

private:
    std::string root_id_;
    std::string name_;
    ContainerKind kind_;
    Capabilities capabilities_;
    std::atomic<bool> closed_{false};
};

/// Opens `path` as an archive container (".zip", ".jar", ".war") or as a
/// directory container. Archives are always read-only.
Box<Container> open_container(const std::filesystem::path& path, bool writable = false);

} // namespace jig::vfs
