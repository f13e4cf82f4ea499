//! # File Handles Implementation

#include "vfs/file_handle.hpp"

#include "vfs/container.hpp"

namespace jig::vfs {

FileHandle::FileHandle(const Container* container, std::string relative_path)
    : container_(container), relative_path_(std::move(relative_path)),
      kind_(infer_kind(relative_path_)) {}

std::string FileHandle::name() const {
    return std::string(file_name_of(relative_path_));
}

std::string FileHandle::uri() const {
    return container_->root_id() + "!/" + relative_path_;
}

std::optional<std::string> FileHandle::binary_name() const {
    return binary_name_of(relative_path_);
}

std::optional<Bytes> FileHandle::read() const {
    return container_->read(relative_path_);
}

std::optional<std::string> FileHandle::read_text() const {
    auto bytes = read();
    if (!bytes) {
        return std::nullopt;
    }
    return to_string(*bytes);
}

std::ostream& operator<<(std::ostream& out, const FileHandle& handle) {
    return out << handle.uri();
}

} // namespace jig::vfs
