//! # Output Allocation Implementation

#include "vfs/output_allocator.hpp"

#include "log/log.hpp"
#include "vfs/directory_container.hpp"
#include "vfs/errors.hpp"
#include "vfs/memory_container.hpp"

namespace jig::vfs {

const char* path_strategy_name(PathStrategy strategy) {
    switch (strategy) {
    case PathStrategy::Memory:
        return "memory";
    case PathStrategy::TempDirectory:
        return "temp-directory";
    }
    return "unknown";
}

OutputAllocator::OutputAllocator(GroupRepository& repository, PathStrategy strategy)
    : repository_(repository), strategy_(strategy) {}

void OutputAllocator::require_output(const Location& location) const {
    if (!location.is_output()) {
        throw UsageError("location " + location.name() +
                         " is not an output location, cannot allocate an output container");
    }
}

Container& OutputAllocator::get_or_create_container(const Location& location) {
    require_output(location);
    if (location.is_module_oriented()) {
        throw UsageError("location " + location.name() +
                         " is module-oriented, a module name is required");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocated_.find(location.name());
    if (it != allocated_.end()) {
        return *it->second;
    }

    auto& container = allocate(repository_.package_group(location));
    allocated_.emplace(location.name(), &container);
    return container;
}

Container& OutputAllocator::get_or_create_container(const Location& location,
                                                    std::string_view module) {
    require_output(location);
    if (!location.is_module_oriented()) {
        throw UsageError("location " + location.name() + " is not module-oriented, cannot use module " +
                         std::string(module));
    }

    auto key = Location::for_module(location, module).name();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allocated_.find(key);
    if (it != allocated_.end()) {
        return *it->second;
    }

    auto& group = repository_.module_partition(location).get_or_create_module(module);
    auto& container = allocate(group);
    allocated_.emplace(std::move(key), &container);
    return container;
}

Container& OutputAllocator::allocate(ContainerGroup& group) {
    if (auto* existing = group.first_writable()) {
        JIG_LOG_DEBUG("output", "Reusing writable container " << existing->name() << " for "
                                                               << group.location().name());
        return *existing;
    }

    Box<Container> container;
    if (strategy_ == PathStrategy::TempDirectory) {
        container = DirectoryContainer::create_temporary(group.location().name());
    } else {
        container = make_box<MemoryContainer>(group.location().name());
    }

    JIG_LOG_DEBUG("output", "Allocated " << path_strategy_name(strategy_) << " container "
                                         << container->root_id() << " for "
                                         << group.location().name());
    return group.add_container(std::move(container));
}

FileHandle OutputAllocator::write(const Location& location, std::string_view path,
                                  const Bytes& contents) {
    return get_or_create_container(location).write(path, contents);
}

FileHandle OutputAllocator::write(const Location& location, std::string_view module,
                                  std::string_view path, const Bytes& contents) {
    return get_or_create_container(location, module).write(path, contents);
}

const ByteSource& OutputAllocator::class_loader(const Location& location) {
    require_output(location);
    return repository_.package_group(location).class_loader();
}

const ByteSource& OutputAllocator::class_loader(const Location& location,
                                                std::string_view module) {
    require_output(location);
    return repository_.module_partition(location).get_or_create_module(module).class_loader();
}

size_t OutputAllocator::allocated_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_.size();
}

} // namespace jig::vfs
