//! # Module Partitions Implementation

#include "vfs/module_partition.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"
#include "vfs/errors.hpp"

namespace jig::vfs {

namespace {

/// Class-loading view over every module of a partition.
class PartitionByteSource : public ByteSource {
public:
    explicit PartitionByteSource(std::function<std::vector<const ContainerGroup*>()> groups)
        : groups_(std::move(groups)) {}

    std::optional<Bytes> fetch(std::string_view binary_name) const override {
        for (const auto* group : groups_()) {
            if (auto bytes = group->class_loader().fetch(binary_name)) {
                return bytes;
            }
        }
        return std::nullopt;
    }

    std::optional<Bytes> fetch_resource(std::string_view path) const override {
        for (const auto* group : groups_()) {
            if (auto bytes = group->class_loader().fetch_resource(path)) {
                return bytes;
            }
        }
        return std::nullopt;
    }

private:
    std::function<std::vector<const ContainerGroup*>()> groups_;
};

} // namespace

ModulePartition::ModulePartition(Location location, FuzzyOptions fuzzy)
    : location_(std::move(location)), fuzzy_(fuzzy) {
    if (!location_.is_module_oriented()) {
        throw UsageError("location " + location_.name() +
                         " is not module-oriented and cannot hold modules");
    }
}

ModulePartition::~ModulePartition() = default;

ContainerGroup& ModulePartition::get_or_create_module(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = modules_.find(name);
    if (it != modules_.end()) {
        return *it->second;
    }

    auto module_location = Location::for_module(location_, name);
    JIG_LOG_DEBUG("vfs", "Registering module " << name << " as " << module_location.name());
    auto [inserted, _] =
        modules_.emplace(std::string(name), make_box<ContainerGroup>(module_location, fuzzy_));
    return *inserted->second;
}

ContainerGroup* ModulePartition::find_module(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = modules_.find(name);
    return it == modules_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ModulePartition::modules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(modules_.size());
    for (const auto& [name, _] : modules_) {
        names.push_back(name);
    }
    return names;
}

std::vector<Location> ModulePartition::module_locations() const {
    std::vector<Location> result;
    for (const auto* group : groups()) {
        result.push_back(group->location());
    }
    return result;
}

std::vector<Suggestion> ModulePartition::suggest_modules(std::string_view query) const {
    return FuzzyMatcher(fuzzy_).rank(query, modules());
}

std::string ModulePartition::describe_missing_module(std::string_view name) const {
    auto known = modules();
    auto suggestions = FuzzyMatcher(fuzzy_).rank(name, known);
    return not_found_message("module", name, suggestions) + "\n  (known modules in " +
           location_.name() + ": " +
           (known.empty() ? std::string("none") : util::worded_list(known, ", ", ", ")) + ")";
}

std::optional<FileHandle> ModulePartition::resolve(std::string_view module,
                                                   std::string_view path) const {
    auto* group = find_module(module);
    if (!group) {
        return std::nullopt;
    }
    return group->resolve(path);
}

const ByteSource& ModulePartition::class_loader() const {
    std::call_once(loader_once_, [this] {
        loader_ = make_box<PartitionByteSource>([this] { return groups(); });
    });
    return *loader_;
}

void ModulePartition::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> failures;
    for (const auto& [name, group] : modules_) {
        try {
            group->close();
        } catch (const BackingStoreError& e) {
            failures.push_back(e.what());
        }
    }

    if (!failures.empty()) {
        auto error = VfsError::io("failed to close " + std::to_string(failures.size()) +
                                  " module(s): " + util::worded_list(failures, "; ", "; "));
        error.location = location_.name();
        throw BackingStoreError(std::move(error));
    }
}

std::vector<const ContainerGroup*> ModulePartition::groups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const ContainerGroup*> result;
    result.reserve(modules_.size());
    for (const auto& [_, group] : modules_) {
        result.push_back(group.get());
    }
    return result;
}

} // namespace jig::vfs
