//! # Relative Paths
//!
//! Every file inside a container is addressed by a normalized relative
//! path: segments separated by '/', no empty or "." segments, no "..".
//! A leading '/' is ignored. A backslash is an ordinary character.
//!
//! This module also maps between paths, binary names ("com.example.Foo")
//! and package names, and infers a file's kind from its extension.

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jig::vfs {

/// Kind of a file, inferred from its extension.
enum class FileKind {
    Source,   ///< ".java"
    Class,    ///< ".class"
    Resource, ///< Any other extension
    Other,    ///< No extension
};

/// Returns the upper-case name of a file kind ("SOURCE", "CLASS", ...).
const char* file_kind_name(FileKind kind);

/// Extension used for a kind (".java", ".class"), empty for Resource and Other.
std::string_view file_kind_extension(FileKind kind);

/// Infers the kind of a file from the extension of its last segment.
FileKind infer_kind(std::string_view path);

/// Normalizes a relative path.
///
/// Returns nullopt for paths containing ".." or NUL, and for paths that
/// normalize to the container root ("", "/", "./.").
std::optional<std::string> normalize_relative_path(std::string_view path);

/// Splits on '/', dropping empty and "." segments.
std::vector<std::string> split_segments(std::string_view path);

/// Joins segments with `separator`.
std::string join_segments(const std::vector<std::string>& segments, std::string_view separator);

/// Last segment of a normalized path.
std::string_view file_name_of(std::string_view path);

/// Everything before the last segment, empty for top-level files.
std::string_view parent_of(std::string_view path);

/// "com.example" -> "com/example".
std::string package_to_path(std::string_view package);

/// "com.example.Foo" + Class -> "com/example/Foo.class".
std::string binary_name_to_path(std::string_view binary_name, FileKind kind);

/// "com/example/Foo.class" -> "com.example.Foo". Nullopt for Resource and
/// Other files, whose names are not binary names.
std::optional<std::string> binary_name_of(std::string_view path);

/// Path of `relative_name` inside `package`. A relative name starting with
/// '/' is taken from the container root instead.
std::optional<std::string> resource_path(std::string_view package, std::string_view relative_name);

/// Throws `UsageError` unless `name` is usable as a container root name:
/// not blank, no surrounding spaces, no '/', '\\' or "..".
void validate_root_name(std::string_view name);

/// True for ".zip", ".jar" and ".war" files (case-insensitive).
bool is_archive_path(const std::filesystem::path& path);

} // namespace jig::vfs
