//! # Directory Containers
//!
//! A container backed by a directory on the real file system. The on-disk
//! layout mirrors relative paths verbatim.
//!
//! A container created with `create_temporary` owns its directory: the
//! directory is created up front and removed recursively when the
//! container is closed or destroyed.

#pragma once

#include "vfs/container.hpp"

#include <mutex>

namespace jig::vfs {

class DirectoryContainer : public Container {
public:
    /// Wraps an existing directory. Throws `BackingStoreError` if `root`
    /// is not a directory.
    DirectoryContainer(std::filesystem::path root, bool writable);
    ~DirectoryContainer() override;

    /// Creates a fresh, writable, owned directory below the system
    /// temporary directory, named after `name`.
    static Box<DirectoryContainer> create_temporary(std::string_view name);

    const std::filesystem::path& root() const {
        return root_;
    }

    bool owns_root() const {
        return owned_;
    }

    bool exists(std::string_view path) const override;
    bool is_directory(std::string_view path) const override;
    std::optional<Bytes> read(std::string_view path) const override;
    FileHandle write(std::string_view path, const Bytes& contents) override;
    std::vector<std::string> list_all() const override;

protected:
    void do_close() override;

private:
    DirectoryContainer(std::filesystem::path root, std::string name, bool owned);

    /// Absolute path of a relative path, nullopt if it is invalid.
    std::optional<std::filesystem::path> to_real_path(std::string_view path) const;

    std::filesystem::path root_;
    bool owned_ = false;
    std::mutex write_mutex_;
};

} // namespace jig::vfs
