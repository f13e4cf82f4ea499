//! # Workspace Errors
//!
//! Error taxonomy of the virtual workspace:
//!
//! | Failure             | Surface                          |
//! |---------------------|----------------------------------|
//! | Lookup miss         | `std::nullopt` / `nullptr`       |
//! | Configuration misuse| throws `UsageError`              |
//! | Post-close usage    | throws `UsageError`              |
//! | Backing-store error | throws `BackingStoreError`       |
//!
//! Errors carry the location name, module and path that were involved so
//! callers can report them without extra bookkeeping.

#pragma once

#include <stdexcept>
#include <string>

namespace jig::vfs {

/// Raised when the caller uses the workspace incorrectly: a module-oriented
/// operation on a package-oriented location, a write to a read-only
/// container, or any use of a resource after it was closed.
class UsageError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// Category of a backing-store failure.
enum class VfsErrorKind {
    Io,          ///< The operating system reported an I/O error
    Conflict,    ///< A file and a directory would share a path
    Corrupt,     ///< Archive structure could not be parsed
    Unsupported, ///< Archive feature that is not supported (ZIP64, encryption)
};

/// Returns a short name for the error kind ("io", "conflict", ...).
const char* error_kind_name(VfsErrorKind kind);

/// Details of a backing-store failure.
struct VfsError {
    VfsErrorKind kind = VfsErrorKind::Io;
    std::string message;
    std::string location; ///< Location name, empty when unknown
    std::string module;   ///< Module name, empty for package-oriented groups
    std::string path;     ///< Relative path or archive path involved

    static VfsError io(std::string message, std::string path = "") {
        return VfsError{VfsErrorKind::Io, std::move(message), "", "", std::move(path)};
    }

    static VfsError conflict(std::string message, std::string path) {
        return VfsError{VfsErrorKind::Conflict, std::move(message), "", "", std::move(path)};
    }

    static VfsError corrupt(std::string message, std::string path) {
        return VfsError{VfsErrorKind::Corrupt, std::move(message), "", "", std::move(path)};
    }

    static VfsError unsupported(std::string message, std::string path) {
        return VfsError{VfsErrorKind::Unsupported, std::move(message), "", "", std::move(path)};
    }

    /// "<message> (location X, module M, path P)", omitting empty parts.
    std::string to_string() const;
};

/// Raised when a directory, archive or in-memory store fails.
class BackingStoreError : public std::runtime_error {
public:
    explicit BackingStoreError(VfsError error);

    const VfsError& error() const {
        return error_;
    }

    /// Copy of this error with the location (and module) filled in when it
    /// was not already known.
    BackingStoreError with_context(const std::string& location,
                                   const std::string& module = "") const;

private:
    VfsError error_;
};

} // namespace jig::vfs
