//! # Container Groups Implementation

#include "vfs/container_group.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"
#include "vfs/errors.hpp"

#include <algorithm>

namespace jig::vfs {

namespace {

/// Class-loading view over one group.
class GroupByteSource : public ByteSource {
public:
    explicit GroupByteSource(const ContainerGroup& group) : group_(group) {}

    std::optional<Bytes> fetch(std::string_view binary_name) const override {
        auto handle = group_.find_class(binary_name, FileKind::Class);
        if (!handle) {
            JIG_LOG_TRACE("vfs", "Class " << binary_name << " not found in "
                                          << group_.location().name());
            return std::nullopt;
        }
        return handle->read();
    }

    std::optional<Bytes> fetch_resource(std::string_view path) const override {
        auto handle = group_.resolve(path);
        if (!handle) {
            return std::nullopt;
        }
        return handle->read();
    }

private:
    const ContainerGroup& group_;
};

/// True if `path` lies in `package_path`, directly or (with `recurse`) below it.
bool in_package(std::string_view path, std::string_view package_path, bool recurse) {
    std::string_view rest = path;
    if (!package_path.empty()) {
        if (path.size() <= package_path.size() || path.substr(0, package_path.size()) != package_path ||
            path[package_path.size()] != '/') {
            return false;
        }
        rest = path.substr(package_path.size() + 1);
    }
    return recurse || rest.find('/') == std::string_view::npos;
}

} // namespace

ContainerGroup::ContainerGroup(Location location, FuzzyOptions fuzzy)
    : location_(std::move(location)), matcher_(fuzzy) {}

ContainerGroup::~ContainerGroup() = default;

Container& ContainerGroup::add_container(Box<Container> container) {
    if (!container) {
        throw UsageError("cannot add a null container to " + location_.name());
    }

    std::unique_lock lock(mutex_);
    for (const auto& existing : containers_) {
        if (existing.get() == container.get()) {
            throw UsageError("container " + container->name() + " is already part of " +
                             location_.name());
        }
    }

    JIG_LOG_DEBUG("vfs", "Adding " << container_kind_name(container->kind()) << " container "
                                   << container->name() << " to " << location_.name()
                                   << " at position " << containers_.size());
    containers_.push_back(std::move(container));
    return *containers_.back();
}

std::optional<FileHandle> ContainerGroup::resolve(std::string_view path) const {
    auto normalized = normalize_relative_path(path);
    if (!normalized) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    try {
        for (const auto& container : containers_) {
            if (container->exists(*normalized)) {
                return FileHandle(container.get(), *normalized);
            }
        }
    } catch (const BackingStoreError& e) {
        rethrow_with_context(e);
    }
    return std::nullopt;
}

std::vector<FileHandle> ContainerGroup::list_all() const {
    std::shared_lock lock(mutex_);
    std::vector<FileHandle> result;
    try {
        for (const auto& container : containers_) {
            for (auto& path : container->list_all()) {
                result.emplace_back(container.get(), std::move(path));
            }
        }
    } catch (const BackingStoreError& e) {
        rethrow_with_context(e);
    }
    return result;
}

bool ContainerGroup::contains(const FileHandle& handle) const {
    std::shared_lock lock(mutex_);
    auto owned = std::any_of(containers_.begin(), containers_.end(), [&](const auto& container) {
        return container.get() == &handle.container();
    });
    return owned && handle.container().exists(handle.relative_path());
}

std::optional<FileHandle> ContainerGroup::find_for_input(std::string_view package,
                                                         std::string_view relative_name) const {
    auto path = resource_path(package, relative_name);
    if (!path) {
        return std::nullopt;
    }
    return resolve(*path);
}

std::optional<FileHandle> ContainerGroup::find_class(std::string_view binary_name,
                                                     FileKind kind) const {
    if (binary_name.empty()) {
        return std::nullopt;
    }
    return resolve(binary_name_to_path(binary_name, kind));
}

std::vector<FileHandle> ContainerGroup::list(std::string_view package,
                                             const std::set<FileKind>& kinds,
                                             bool recurse) const {
    auto package_path = package_to_path(package);

    std::vector<FileHandle> result;
    for (auto& handle : list_all()) {
        if (!in_package(handle.relative_path(), package_path, recurse)) {
            continue;
        }
        if (!kinds.empty() && kinds.count(handle.kind()) == 0) {
            continue;
        }
        result.push_back(std::move(handle));
    }
    return result;
}

std::optional<std::string> ContainerGroup::infer_binary_name(const FileHandle& handle) const {
    if (!contains(handle)) {
        return std::nullopt;
    }
    return handle.binary_name();
}

std::vector<const Container*> ContainerGroup::containers() const {
    std::shared_lock lock(mutex_);
    std::vector<const Container*> result;
    result.reserve(containers_.size());
    for (const auto& container : containers_) {
        result.push_back(container.get());
    }
    return result;
}

size_t ContainerGroup::size() const {
    std::shared_lock lock(mutex_);
    return containers_.size();
}

Container* ContainerGroup::first_writable() const {
    std::shared_lock lock(mutex_);
    for (const auto& container : containers_) {
        if (container->is_writable() && !container->is_closed()) {
            return container.get();
        }
    }
    return nullptr;
}

std::vector<Suggestion> ContainerGroup::suggest(std::string_view query) const {
    std::vector<std::string> candidates;
    for (const auto& handle : list_all()) {
        candidates.push_back(handle.relative_path());
    }
    return matcher_.rank(query, candidates);
}

std::string ContainerGroup::describe_missing(std::string_view path) const {
    return not_found_message("file", path, suggest(path)) + "\n  (searched " +
           std::to_string(size()) + " container(s) in " + location_.name() + ")";
}

const ByteSource& ContainerGroup::class_loader() const {
    std::call_once(loader_once_, [this] {
        JIG_LOG_DEBUG("vfs", "Creating class-loading view for " << location_.name());
        loader_ = make_box<GroupByteSource>(*this);
    });
    return *loader_;
}

void ContainerGroup::close() {
    std::unique_lock lock(mutex_);

    std::vector<std::string> failures;
    for (const auto& container : containers_) {
        try {
            container->close();
        } catch (const BackingStoreError& e) {
            failures.push_back(e.what());
        }
    }

    if (!failures.empty()) {
        auto error = VfsError::io("failed to close " + std::to_string(failures.size()) +
                                  " container(s): " + util::worded_list(failures, "; ", "; "));
        error.location = location_.name();
        throw BackingStoreError(std::move(error));
    }
}

void ContainerGroup::rethrow_with_context(const BackingStoreError& error) const {
    if (location_.is_module_location()) {
        throw error.with_context(location_.parent_name(), location_.module_name());
    }
    throw error.with_context(location_.name());
}

} // namespace jig::vfs
