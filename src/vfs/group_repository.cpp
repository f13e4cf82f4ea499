//! # Group Repository Implementation

#include "vfs/group_repository.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"
#include "vfs/errors.hpp"

#include <algorithm>

namespace jig::vfs {

GroupRepository::GroupRepository(FuzzyOptions fuzzy) : fuzzy_(fuzzy) {}

GroupRepository::~GroupRepository() = default;

ContainerGroup& GroupRepository::package_group(const Location& location) {
    if (location.is_module_oriented()) {
        throw UsageError("location " + location.name() +
                         " is module-oriented, use a module partition instead");
    }
    if (location.is_module_location()) {
        throw UsageError("location " + location.name() + " belongs to module " +
                         location.module_name() + " of " + location.parent_name() +
                         ", look it up through that partition");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = packages_[location.name()];
    if (!slot) {
        JIG_LOG_DEBUG("vfs", "Creating container group for " << location.name());
        slot = make_box<ContainerGroup>(location, fuzzy_);
    }
    return *slot;
}

ContainerGroup* GroupRepository::find_package_group(const Location& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = packages_.find(location.name());
    return it == packages_.end() ? nullptr : it->second.get();
}

ModulePartition& GroupRepository::module_partition(const Location& location) {
    if (!location.is_module_oriented()) {
        throw UsageError("location " + location.name() +
                         " is not module-oriented and has no module partition");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = partitions_[location.name()];
    if (!slot) {
        JIG_LOG_DEBUG("vfs", "Creating module partition for " << location.name());
        slot = make_box<ModulePartition>(location, fuzzy_);
    }
    return *slot;
}

ModulePartition* GroupRepository::find_module_partition(const Location& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = partitions_.find(location.name());
    return it == partitions_.end() ? nullptr : it->second.get();
}

ContainerGroup* GroupRepository::find_module_group(const Location& location,
                                                   std::string_view module) const {
    auto* partition = find_module_partition(location);
    return partition ? partition->find_module(module) : nullptr;
}

bool GroupRepository::has_location(const Location& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return packages_.count(location.name()) > 0 || partitions_.count(location.name()) > 0;
}

std::vector<Location> GroupRepository::locations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Location> result;
    for (const auto& [_, group] : packages_) {
        result.push_back(group->location());
    }
    for (const auto& [_, partition] : partitions_) {
        result.push_back(partition->location());
    }
    std::sort(result.begin(), result.end());
    return result;
}

void GroupRepository::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> failures;
    for (const auto& [name, group] : packages_) {
        try {
            group->close();
        } catch (const BackingStoreError& e) {
            failures.push_back(e.what());
        }
    }
    for (const auto& [name, partition] : partitions_) {
        try {
            partition->close();
        } catch (const BackingStoreError& e) {
            failures.push_back(e.what());
        }
    }

    if (!failures.empty()) {
        throw BackingStoreError(VfsError::io("failed to close " +
                                             std::to_string(failures.size()) + " location(s): " +
                                             util::worded_list(failures, "; ", "; ")));
    }
}

} // namespace jig::vfs
