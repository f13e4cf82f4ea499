//! # Directory Containers Implementation

#include "vfs/directory_container.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"
#include "vfs/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <random>

namespace jig::vfs {

namespace fs = std::filesystem;

namespace {

std::string root_name_of(const fs::path& root) {
    auto name = root.filename().string();
    return name.empty() ? root.string() : name;
}

fs::path absolute_root(const fs::path& root) {
    std::error_code ec;
    auto absolute = fs::absolute(root, ec);
    if (ec) {
        throw BackingStoreError(
            VfsError::io("cannot resolve directory: " + ec.message(), root.string()));
    }
    return absolute.lexically_normal();
}

std::string random_suffix() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    static constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string suffix;
    for (int i = 0; i < 12; ++i) {
        suffix += alphabet[pick(engine)];
    }
    return suffix;
}

} // namespace

DirectoryContainer::DirectoryContainer(fs::path root, bool writable)
    : Container(absolute_root(root).string(), root_name_of(absolute_root(root)),
                ContainerKind::Directory, Capabilities{true, writable}),
      root_(absolute_root(root)) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw BackingStoreError(VfsError::io("not a directory", root_.string()));
    }
}

DirectoryContainer::DirectoryContainer(fs::path root, std::string name, bool owned)
    : Container(root.string(), std::move(name), ContainerKind::Directory,
                Capabilities{true, true}),
      root_(std::move(root)), owned_(owned) {}

DirectoryContainer::~DirectoryContainer() {
    close_on_destruction();
}

Box<DirectoryContainer> DirectoryContainer::create_temporary(std::string_view name) {
    validate_root_name(name);

    std::error_code ec;
    auto base = fs::temp_directory_path(ec);
    if (ec) {
        throw BackingStoreError(VfsError::io("no temporary directory: " + ec.message()));
    }

    auto root = base / ("jig-" + std::string(name) + "-" + random_suffix());
    if (!fs::create_directories(root, ec) || ec) {
        throw BackingStoreError(VfsError::io(
            "cannot create temporary directory" + (ec ? ": " + ec.message() : std::string()),
            root.string()));
    }

    JIG_LOG_DEBUG("vfs", "Created temporary directory " << root.string());
    return Box<DirectoryContainer>(new DirectoryContainer(root, std::string(name), true));
}

std::optional<fs::path> DirectoryContainer::to_real_path(std::string_view path) const {
    auto normalized = normalize_relative_path(path);
    if (!normalized) {
        return std::nullopt;
    }
    return root_ / fs::path(*normalized);
}

bool DirectoryContainer::exists(std::string_view path) const {
    ensure_open("check existence");
    auto real = to_real_path(path);
    if (!real) {
        return false;
    }

    std::error_code ec;
    auto status = fs::status(*real, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        throw BackingStoreError(
            VfsError::io("cannot stat file: " + ec.message(), std::string(path)));
    }
    return fs::is_regular_file(status);
}

bool DirectoryContainer::is_directory(std::string_view path) const {
    ensure_open("check directory");
    auto real = to_real_path(path);
    if (!real) {
        return false;
    }

    std::error_code ec;
    return fs::is_directory(*real, ec);
}

std::optional<Bytes> DirectoryContainer::read(std::string_view path) const {
    if (!exists(path)) {
        return std::nullopt;
    }

    auto real = *to_real_path(path);
    std::ifstream in(real, std::ios::binary);
    if (!in) {
        throw BackingStoreError(VfsError::io("cannot open file", real.string()));
    }

    Bytes contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw BackingStoreError(VfsError::io("failed to read file", real.string()));
    }
    return contents;
}

FileHandle DirectoryContainer::write(std::string_view path, const Bytes& contents) {
    auto normalized = prepare_write(path);
    auto real = root_ / fs::path(normalized);

    std::lock_guard<std::mutex> lock(write_mutex_);

    std::error_code ec;
    fs::create_directories(real.parent_path(), ec);
    if (ec) {
        throw BackingStoreError(
            VfsError::io("cannot create parent directories: " + ec.message(), normalized));
    }
    if (fs::is_directory(real, ec)) {
        throw BackingStoreError(
            VfsError::conflict("cannot write a file over a directory", normalized));
    }

    std::ofstream out(real, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw BackingStoreError(VfsError::io("cannot open file for writing", real.string()));
    }
    out.write(reinterpret_cast<const char*>(contents.data()),
              static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) {
        throw BackingStoreError(VfsError::io("failed to write file", real.string()));
    }

    JIG_LOG_TRACE("vfs", "Wrote " << contents.size() << " bytes to " << real.string());
    return FileHandle(this, normalized);
}

std::vector<std::string> DirectoryContainer::list_all() const {
    ensure_open("list files");

    std::vector<std::string> result;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root_, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        auto relative = normalize_relative_path(fs::relative(it->path(), root_).generic_string());
        if (relative) {
            result.push_back(std::move(*relative));
        }
    }
    if (ec) {
        throw BackingStoreError(
            VfsError::io("failed to walk directory: " + ec.message(), root_.string()));
    }

    std::sort(result.begin(), result.end());
    return result;
}

void DirectoryContainer::do_close() {
    if (!owned_) {
        return;
    }

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        throw BackingStoreError(
            VfsError::io("cannot remove temporary directory: " + ec.message(), root_.string()));
    }
    JIG_LOG_DEBUG("vfs", "Removed temporary directory " << root_.string());
}

} // namespace jig::vfs
