//! # Output Allocation
//!
//! Hands out the writable container of an output location. The first
//! request for a location (or location and module) allocates a container
//! and appends it to that location's group; every later request returns
//! the same container. Allocation is atomic: threads racing to write the
//! first file of a location all receive the winner's container.
//!
//! ```cpp
//! auto& out = allocator.get_or_create_container(locations::CLASS_OUTPUT);
//! out.write("com/example/Foo.class", bytes);
//! auto loaded = allocator.class_loader(locations::CLASS_OUTPUT).fetch("com.example.Foo");
//! ```

#pragma once

#include "vfs/group_repository.hpp"

#include <map>
#include <mutex>

namespace jig::vfs {

/// Backing store used for newly allocated output containers.
enum class PathStrategy {
    Memory,        ///< In-memory tree (default)
    TempDirectory, ///< Owned directory below the system temp directory
};

/// Returns "memory" or "temp-directory".
const char* path_strategy_name(PathStrategy strategy);

class OutputAllocator {
public:
    explicit OutputAllocator(GroupRepository& repository,
                             PathStrategy strategy = PathStrategy::Memory);

    PathStrategy strategy() const {
        return strategy_;
    }

    /// Writable container of a package-oriented output location.
    /// Throws `UsageError` for input or module-oriented locations.
    Container& get_or_create_container(const Location& location);

    /// Writable container of module `module` in a module-oriented output
    /// location. Throws `UsageError` for input or package-oriented locations.
    Container& get_or_create_container(const Location& location, std::string_view module);

    FileHandle write(const Location& location, std::string_view path, const Bytes& contents);

    FileHandle write(const Location& location, std::string_view module, std::string_view path,
                     const Bytes& contents);

    /// Live class-loading view of an output location. Writes made after
    /// the view was obtained are visible through it.
    const ByteSource& class_loader(const Location& location);

    const ByteSource& class_loader(const Location& location, std::string_view module);

    /// Number of distinct output keys that have a container.
    size_t allocated_count() const;

private:
    /// Returns the group's existing writable container or appends a new one.
    Container& allocate(ContainerGroup& group);

    void require_output(const Location& location) const;

    GroupRepository& repository_;
    PathStrategy strategy_;

    mutable std::mutex mutex_;
    std::map<std::string, Container*> allocated_;
};

} // namespace jig::vfs
