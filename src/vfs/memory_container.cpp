//! # In-Memory Containers Implementation

#include "vfs/memory_container.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"
#include "vfs/errors.hpp"

#include <fstream>
#include <iterator>
#include <mutex>

namespace jig::vfs {

namespace fs = std::filesystem;

namespace {

std::string next_memory_id(const std::string& name) {
    static std::atomic<uint64_t> counter{0};
    return "memory://" + name + "-" + std::to_string(++counter);
}

Bytes read_real_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw BackingStoreError(VfsError::io("cannot open file for copying", path.string()));
    }
    Bytes contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw BackingStoreError(VfsError::io("failed to read file for copying", path.string()));
    }
    return contents;
}

} // namespace

MemoryContainer::MemoryContainer(std::string name)
    : Container(next_memory_id(name), name, ContainerKind::Memory, Capabilities{true, true}) {
    validate_root_name(this->name());
}

MemoryContainer::~MemoryContainer() {
    close_on_destruction();
}

bool MemoryContainer::exists(std::string_view path) const {
    ensure_open("check existence");
    auto normalized = normalize_relative_path(path);
    if (!normalized) {
        return false;
    }

    std::shared_lock lock(mutex_);
    return files_.count(*normalized) > 0;
}

bool MemoryContainer::is_directory(std::string_view path) const {
    ensure_open("check directory");
    auto normalized = normalize_relative_path(path);
    if (!normalized) {
        return false;
    }

    std::shared_lock lock(mutex_);
    return directories_.count(*normalized) > 0;
}

std::optional<Bytes> MemoryContainer::read(std::string_view path) const {
    ensure_open("read");
    auto normalized = normalize_relative_path(path);
    if (!normalized) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    auto it = files_.find(*normalized);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

FileHandle MemoryContainer::write(std::string_view path, const Bytes& contents) {
    auto normalized = prepare_write(path);

    {
        std::unique_lock lock(mutex_);
        if (directories_.count(normalized) > 0) {
            throw BackingStoreError(
                VfsError::conflict("cannot write a file over a directory", normalized));
        }
        // No parent of the new file may be a file.
        for (auto parent = parent_of(normalized); !parent.empty(); parent = parent_of(parent)) {
            if (files_.count(std::string(parent)) > 0) {
                throw BackingStoreError(VfsError::conflict(
                    "parent " + util::quoted(parent) + " is a file", normalized));
            }
        }

        add_parents(normalized);
        files_[normalized] = contents;
    }

    JIG_LOG_TRACE("vfs", "Wrote " << contents.size() << " bytes to " << name() << "/" << normalized);
    return FileHandle(this, normalized);
}

std::vector<std::string> MemoryContainer::list_all() const {
    ensure_open("list files");
    std::shared_lock lock(mutex_);

    std::vector<std::string> result;
    result.reserve(files_.size());
    for (const auto& [path, _] : files_) {
        result.push_back(path);
    }
    return result;
}

MemoryContainer& MemoryContainer::create_file(std::string_view path, std::string_view text) {
    write(path, to_bytes(text));
    return *this;
}

MemoryContainer& MemoryContainer::create_directory(std::string_view path) {
    auto normalized = prepare_write(path);

    std::unique_lock lock(mutex_);
    if (files_.count(normalized) > 0) {
        throw BackingStoreError(
            VfsError::conflict("cannot create a directory over a file", normalized));
    }
    add_parents(normalized);
    directories_.insert(normalized);
    return *this;
}

MemoryContainer& MemoryContainer::copy_from(const fs::path& source, std::string_view target) {
    std::error_code ec;
    if (fs::is_regular_file(source, ec)) {
        write(target, read_real_file(source));
        return *this;
    }
    if (!fs::is_directory(source, ec)) {
        throw BackingStoreError(
            VfsError::io("cannot copy, not a file or directory", source.string()));
    }

    auto base = normalize_relative_path(target);
    auto destination = [&](const fs::path& relative) {
        auto rel = relative.generic_string();
        return base ? *base + "/" + rel : rel;
    };

    for (auto it = fs::recursive_directory_iterator(source, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        auto relative = fs::relative(it->path(), source);
        if (it->is_directory()) {
            create_directory(destination(relative));
        } else if (it->is_regular_file()) {
            write(destination(relative), read_real_file(it->path()));
        }
    }
    if (ec) {
        throw BackingStoreError(VfsError::io("failed to walk directory: " + ec.message(),
                                             source.string()));
    }
    return *this;
}

size_t MemoryContainer::file_count() const {
    std::shared_lock lock(mutex_);
    return files_.size();
}

void MemoryContainer::do_close() {
    std::unique_lock lock(mutex_);
    files_.clear();
    directories_.clear();
}

void MemoryContainer::add_parents(const std::string& path) {
    for (auto parent = parent_of(path); !parent.empty(); parent = parent_of(parent)) {
        directories_.emplace(parent);
    }
}

} // namespace jig::vfs
