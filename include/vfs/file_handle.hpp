//! # File Handles
//!
//! A `FileHandle` is the answer to a successful lookup: the container that
//! holds the file, the normalized relative path inside it and the inferred
//! kind. Handles are small immutable values; they do not keep the
//! container alive and must not outlive the workspace.

#pragma once

#include "common.hpp"
#include "vfs/paths.hpp"

#include <ostream>
#include <string>

namespace jig::vfs {

class Container;

class FileHandle {
public:
    FileHandle(const Container* container, std::string relative_path);

    const Container& container() const {
        return *container_;
    }

    /// Normalized path relative to the container root.
    const std::string& relative_path() const {
        return relative_path_;
    }

    FileKind kind() const {
        return kind_;
    }

    /// Last path segment.
    std::string name() const;

    /// "<root id>!/<relative path>", unique across the workspace.
    std::string uri() const;

    /// Binary name for source and class files.
    std::optional<std::string> binary_name() const;

    /// Reads the file through its container.
    /// Nullopt if it was removed since the lookup.
    std::optional<Bytes> read() const;

    /// Reads the file as text.
    std::optional<std::string> read_text() const;

    bool operator==(const FileHandle& other) const {
        return container_ == other.container_ && relative_path_ == other.relative_path_;
    }

    bool operator!=(const FileHandle& other) const {
        return !(*this == other);
    }

private:
    const Container* container_;
    std::string relative_path_;
    FileKind kind_;
};

std::ostream& operator<<(std::ostream& out, const FileHandle& handle);

} // namespace jig::vfs
