//! # In-Memory Containers
//!
//! A writable tree of files held in memory. This is the default backing
//! for output locations and the usual way tests provide source inputs.
//!
//! ```cpp
//! auto root = make_box<MemoryContainer>("sources");
//! root->create_file("com/example/Foo.java", "package com.example; class Foo {}");
//! ```
//!
//! Directories are tracked explicitly so that a file and a directory can
//! never share a path. Access is guarded by a shared mutex: any number of
//! readers, one writer.

#pragma once

#include "vfs/container.hpp"

#include <map>
#include <set>
#include <shared_mutex>

namespace jig::vfs {

class MemoryContainer : public Container {
public:
    /// `name` must be a valid root name (see `validate_root_name`).
    explicit MemoryContainer(std::string name);
    ~MemoryContainer() override;

    bool exists(std::string_view path) const override;
    bool is_directory(std::string_view path) const override;
    std::optional<Bytes> read(std::string_view path) const override;
    FileHandle write(std::string_view path, const Bytes& contents) override;
    std::vector<std::string> list_all() const override;

    /// Creates a text file; returns `*this` for chaining.
    MemoryContainer& create_file(std::string_view path, std::string_view text);

    /// Creates an empty directory (and its parents).
    MemoryContainer& create_directory(std::string_view path);

    /// Copies a file, or a directory tree recursively, from the real file
    /// system to `target` inside this container.
    MemoryContainer& copy_from(const std::filesystem::path& source, std::string_view target);

    /// Number of regular files.
    size_t file_count() const;

protected:
    void do_close() override;

private:
    /// Registers every parent of `path` as a directory. Requires the write lock.
    void add_parents(const std::string& path);

    mutable std::shared_mutex mutex_;
    std::map<std::string, Bytes> files_;
    std::set<std::string> directories_;
};

} // namespace jig::vfs
