//! # Module Partitions
//!
//! A module-oriented location is split into modules, each with its own
//! independent `ContainerGroup`. A file added to one module is never
//! visible through another.
//!
//! Module names are compared exactly; "foo.bar" and "Foo.Bar" are two
//! different modules.

#pragma once

#include "vfs/container_group.hpp"

#include <functional>
#include <map>

namespace jig::vfs {

class ModulePartition {
public:
    /// Throws `UsageError` if `location` is not module-oriented.
    explicit ModulePartition(Location location, FuzzyOptions fuzzy = {});
    ~ModulePartition();

    ModulePartition(const ModulePartition&) = delete;
    ModulePartition& operator=(const ModulePartition&) = delete;

    const Location& location() const {
        return location_;
    }

    /// Group of module `name`, registering an empty one on first use.
    ContainerGroup& get_or_create_module(std::string_view name);

    /// Group of module `name`, or nullptr. Never creates a module.
    ContainerGroup* find_module(std::string_view name) const;

    bool has_module(std::string_view name) const {
        return find_module(name) != nullptr;
    }

    /// Registered module names in sorted order.
    std::vector<std::string> modules() const;

    /// Derived locations of every registered module.
    std::vector<Location> module_locations() const;

    /// Module names resembling `query`.
    std::vector<Suggestion> suggest_modules(std::string_view query) const;

    /// Not-found message for module `name` including suggestions.
    std::string describe_missing_module(std::string_view name) const;

    /// Resolves `path` in module `module`. Nullopt when either is missing.
    std::optional<FileHandle> resolve(std::string_view module, std::string_view path) const;

    /// Live class-loading view searching every module in name order.
    const ByteSource& class_loader() const;

    /// Closes every module group, collecting failures.
    void close();

private:
    /// Snapshot of the groups in module name order.
    std::vector<const ContainerGroup*> groups() const;

    Location location_;
    FuzzyOptions fuzzy_;

    mutable std::mutex mutex_;
    std::map<std::string, Box<ContainerGroup>, std::less<>> modules_;

    mutable std::once_flag loader_once_;
    mutable Box<ByteSource> loader_;
};

} // namespace jig::vfs
