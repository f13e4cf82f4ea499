//! # Relative Paths Implementation

#include "vfs/paths.hpp"

#include "util/strings.hpp"
#include "vfs/errors.hpp"

#include <algorithm>
#include <array>

namespace jig::vfs {

const char* file_kind_name(FileKind kind) {
    switch (kind) {
    case FileKind::Source:
        return "SOURCE";
    case FileKind::Class:
        return "CLASS";
    case FileKind::Resource:
        return "RESOURCE";
    case FileKind::Other:
        return "OTHER";
    }
    return "OTHER";
}

std::string_view file_kind_extension(FileKind kind) {
    switch (kind) {
    case FileKind::Source:
        return ".java";
    case FileKind::Class:
        return ".class";
    case FileKind::Resource:
    case FileKind::Other:
        return "";
    }
    return "";
}

FileKind infer_kind(std::string_view path) {
    auto name = file_name_of(path);
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return FileKind::Other;
    }

    auto extension = name.substr(dot);
    if (extension == ".java") {
        return FileKind::Source;
    }
    if (extension == ".class") {
        return FileKind::Class;
    }
    return FileKind::Resource;
}

std::vector<std::string> split_segments(std::string_view path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }

        auto segment = path.substr(pos, slash - pos);
        if (!segment.empty() && segment != ".") {
            segments.emplace_back(segment);
        }
        pos = slash + 1;
    }
    return segments;
}

std::string join_segments(const std::vector<std::string>& segments, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += segments[i];
    }
    return result;
}

std::optional<std::string> normalize_relative_path(std::string_view path) {
    if (path.find('\0') != std::string_view::npos) {
        return std::nullopt;
    }

    auto segments = split_segments(path);
    if (segments.empty()) {
        return std::nullopt;
    }
    for (const auto& segment : segments) {
        if (segment == "..") {
            return std::nullopt;
        }
    }
    return join_segments(segments, "/");
}

std::string_view file_name_of(std::string_view path) {
    auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string_view parent_of(std::string_view path) {
    auto slash = path.rfind('/');
    return slash == std::string_view::npos ? std::string_view{} : path.substr(0, slash);
}

std::string package_to_path(std::string_view package) {
    std::string result(package);
    std::replace(result.begin(), result.end(), '.', '/');
    return result;
}

std::string binary_name_to_path(std::string_view binary_name, FileKind kind) {
    return package_to_path(binary_name) + std::string(file_kind_extension(kind));
}

std::optional<std::string> binary_name_of(std::string_view path) {
    auto kind = infer_kind(path);
    if (kind != FileKind::Source && kind != FileKind::Class) {
        return std::nullopt;
    }

    auto extension = file_kind_extension(kind);
    std::string stem(path.substr(0, path.size() - extension.size()));
    std::replace(stem.begin(), stem.end(), '/', '.');
    return stem;
}

std::optional<std::string> resource_path(std::string_view package,
                                         std::string_view relative_name) {
    if (!relative_name.empty() && relative_name.front() == '/') {
        return normalize_relative_path(relative_name);
    }
    return normalize_relative_path(package_to_path(package) + "/" + std::string(relative_name));
}

void validate_root_name(std::string_view name) {
    if (name.find_first_not_of(" \t") == std::string_view::npos) {
        throw UsageError("root name must not be blank");
    }
    if (name.front() == ' ' || name.back() == ' ') {
        throw UsageError("root name " + util::quoted(name) +
                         " must not start or end with spaces");
    }
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
        throw UsageError("root name " + util::quoted(name) + " must not contain path separators");
    }
    if (name.find("..") != std::string_view::npos) {
        throw UsageError("root name " + util::quoted(name) + " must not contain \"..\"");
    }
}

bool is_archive_path(const std::filesystem::path& path) {
    static constexpr std::array<std::string_view, 3> extensions = {".zip", ".jar", ".war"};
    auto name = path.filename().string();
    return std::any_of(extensions.begin(), extensions.end(), [&](std::string_view extension) {
        return util::ends_with_ignore_case(name, extension);
    });
}

} // namespace jig::vfs
