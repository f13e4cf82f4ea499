//! # Container Groups
//!
//! A `ContainerGroup` overlays an ordered list of containers onto one
//! location. Lookups search the containers strictly in insertion order and
//! the first match wins; contents are never merged.
//!
//! ## Ordering
//!
//! Containers can only be appended. Once a container is in the group its
//! position never changes, so a path that resolved to container `i` keeps
//! resolving there until a file is written into an earlier container.
//!
//! ## Thread Safety
//!
//! The container list is guarded by a shared mutex: concurrent lookups take
//! a shared lock, `add_container` takes an exclusive one. Individual
//! containers synchronize their own contents.

#pragma once

#include "vfs/byte_source.hpp"
#include "vfs/container.hpp"
#include "vfs/errors.hpp"
#include "vfs/fuzzy.hpp"
#include "vfs/location.hpp"

#include <mutex>
#include <set>
#include <shared_mutex>

namespace jig::vfs {

class ContainerGroup {
public:
    explicit ContainerGroup(Location location, FuzzyOptions fuzzy = {});
    ~ContainerGroup();

    ContainerGroup(const ContainerGroup&) = delete;
    ContainerGroup& operator=(const ContainerGroup&) = delete;

    const Location& location() const {
        return location_;
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Appends `container` as the lowest-precedence entry and takes
    /// ownership of it.
    Container& add_container(Box<Container> container);

    // ========================================================================
    // Lookup
    // ========================================================================

    /// First container, in insertion order, holding `path`.
    std::optional<FileHandle> resolve(std::string_view path) const;

    /// Every file of every container. A path present in several containers
    /// appears once per container.
    std::vector<FileHandle> list_all() const;

    /// True if `handle` points into one of this group's containers.
    bool contains(const FileHandle& handle) const;

    /// Resolves `relative_name` inside `package` (root-relative when it
    /// starts with '/').
    std::optional<FileHandle> find_for_input(std::string_view package,
                                             std::string_view relative_name) const;

    /// Resolves the source or class file of a binary name.
    std::optional<FileHandle> find_class(std::string_view binary_name, FileKind kind) const;

    /// Files of `package` whose kind is in `kinds` (all kinds when empty),
    /// including sub-packages when `recurse` is set. Ordered by container,
    /// then path.
    std::vector<FileHandle> list(std::string_view package, const std::set<FileKind>& kinds,
                                 bool recurse) const;

    /// Binary name of `handle` if it belongs to this group.
    std::optional<std::string> infer_binary_name(const FileHandle& handle) const;

    /// Snapshot of the containers in precedence order.
    std::vector<const Container*> containers() const;

    size_t size() const;

    bool empty() const {
        return size() == 0;
    }

    /// First writable container, or nullptr.
    Container* first_writable() const;

    // ========================================================================
    // Suggestions and Views
    // ========================================================================

    /// Paths of this group that resemble `query`.
    std::vector<Suggestion> suggest(std::string_view query) const;

    /// Not-found message for `path` including suggestions.
    std::string describe_missing(std::string_view path) const;

    /// Live class-loading view, created on first use.
    const ByteSource& class_loader() const;

    /// Closes every container. Failures are collected and rethrown together
    /// as one `BackingStoreError` after all containers were attempted.
    void close();

private:
    /// Adds the group's location to a backing-store failure.
    [[noreturn]] void rethrow_with_context(const BackingStoreError& error) const;

    Location location_;
    FuzzyMatcher matcher_;

    mutable std::shared_mutex mutex_;
    std::vector<Box<Container>> containers_;

    mutable std::once_flag loader_once_;
    mutable Box<ByteSource> loader_;
};

} // namespace jig::vfs
