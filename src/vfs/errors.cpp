//! # Workspace Errors Implementation

#include "vfs/errors.hpp"

#include <sstream>

namespace jig::vfs {

const char* error_kind_name(VfsErrorKind kind) {
    switch (kind) {
    case VfsErrorKind::Io:
        return "io";
    case VfsErrorKind::Conflict:
        return "conflict";
    case VfsErrorKind::Corrupt:
        return "corrupt";
    case VfsErrorKind::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

std::string VfsError::to_string() const {
    std::ostringstream oss;
    oss << message;

    bool open = false;
    auto part = [&](const char* label, const std::string& value) {
        if (value.empty()) {
            return;
        }
        oss << (open ? ", " : " (") << label << " " << value;
        open = true;
    };
    part("location", location);
    part("module", module);
    part("path", path);
    if (open) {
        oss << ")";
    }
    return oss.str();
}

BackingStoreError::BackingStoreError(VfsError error)
    : std::runtime_error(error.to_string()), error_(std::move(error)) {}

BackingStoreError BackingStoreError::with_context(const std::string& location,
                                                  const std::string& module) const {
    VfsError copy = error_;
    if (copy.location.empty()) {
        copy.location = location;
    }
    if (copy.module.empty()) {
        copy.module = module;
    }
    return BackingStoreError(std::move(copy));
}

} // namespace jig::vfs
