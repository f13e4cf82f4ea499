//! # Container Base Implementation

#include "vfs/container.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"
#include "vfs/archive_container.hpp"
#include "vfs/directory_container.hpp"
#include "vfs/errors.hpp"

namespace jig::vfs {

const char* container_kind_name(ContainerKind kind) {
    switch (kind) {
    case ContainerKind::Directory:
        return "directory";
    case ContainerKind::Archive:
        return "archive";
    case ContainerKind::Memory:
        return "memory";
    }
    return "unknown";
}

Container::Container(std::string root_id, std::string name, ContainerKind kind,
                     Capabilities capabilities)
    : root_id_(std::move(root_id)), name_(std::move(name)), kind_(kind),
      capabilities_(capabilities) {}

std::optional<FileHandle> Container::find(std::string_view path) const {
    auto normalized = normalize_relative_path(path);
    if (!normalized || !exists(*normalized)) {
        return std::nullopt;
    }
    return FileHandle(this, std::move(*normalized));
}

void Container::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    JIG_LOG_DEBUG("vfs", "Closing " << container_kind_name(kind_) << " container " << name_);
    do_close();
}

void Container::ensure_open(std::string_view operation) const {
    if (is_closed()) {
        throw UsageError("cannot " + std::string(operation) + " on closed " +
                         container_kind_name(kind_) + " container " + util::quoted(name_));
    }
}

std::string Container::prepare_write(std::string_view path) const {
    ensure_open("write");
    if (!capabilities_.writable) {
        throw UsageError(std::string(container_kind_name(kind_)) + " container " +
                         util::quoted(name_) + " is read-only, cannot write " +
                         util::quoted(path));
    }

    auto normalized = normalize_relative_path(path);
    if (!normalized) {
        throw UsageError("invalid relative path " + util::quoted(path) + " for container " +
                         util::quoted(name_));
    }
    return *normalized;
}

void Container::close_on_destruction() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        JIG_LOG_ERROR("vfs", "Failed to close container " << name_ << ": " << e.what());
    }
}

Box<Container> open_container(const std::filesystem::path& path, bool writable) {
    if (is_archive_path(path)) {
        if (writable) {
            throw UsageError("archive " + util::quoted(path.string()) + " cannot be writable");
        }
        return make_box<ArchiveContainer>(path);
    }
    return make_box<DirectoryContainer>(path, writable);
}

} // namespace jig::vfs
