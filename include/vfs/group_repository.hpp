//! # Group Repository
//!
//! Owns the container group of every package-oriented location and the
//! module partition of every module-oriented location in a workspace.
//! Groups and partitions are created on first request and live until the
//! repository is destroyed, so references handed out stay valid.

#pragma once

#include "vfs/module_partition.hpp"

#include <map>
#include <mutex>

namespace jig::vfs {

class GroupRepository {
public:
    explicit GroupRepository(FuzzyOptions fuzzy = {});
    ~GroupRepository();

    GroupRepository(const GroupRepository&) = delete;
    GroupRepository& operator=(const GroupRepository&) = delete;

    const FuzzyOptions& fuzzy() const {
        return fuzzy_;
    }

    /// Group of a package-oriented location, created on first use.
    /// Throws `UsageError` for module-oriented and module locations.
    ContainerGroup& package_group(const Location& location);

    /// Group of a package-oriented location, or nullptr.
    ContainerGroup* find_package_group(const Location& location) const;

    /// Partition of a module-oriented location, created on first use.
    /// Throws `UsageError` for package-oriented locations.
    ModulePartition& module_partition(const Location& location);

    /// Partition of a module-oriented location, or nullptr.
    ModulePartition* find_module_partition(const Location& location) const;

    /// Group of module `module` in `location`, or nullptr. Never creates.
    ContainerGroup* find_module_group(const Location& location, std::string_view module) const;

    bool has_location(const Location& location) const;

    /// Every configured location, sorted by name.
    std::vector<Location> locations() const;

    /// Closes every group and partition, rethrowing collected failures as
    /// one `BackingStoreError`.
    void close();

private:
    FuzzyOptions fuzzy_;

    mutable std::mutex mutex_;
    std::map<std::string, Box<ContainerGroup>> packages_;
    std::map<std::string, Box<ModulePartition>> partitions_;
};

} // namespace jig::vfs
