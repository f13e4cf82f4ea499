//! # Workspace Implementation

#include "vfs/workspace.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"
#include "vfs/errors.hpp"
#include "vfs/tree_printer.hpp"

#include <algorithm>
#include <sstream>

namespace jig::vfs {

namespace fs = std::filesystem;

namespace {

bool is_module_root(const fs::path& directory) {
    std::error_code ec;
    return fs::is_regular_file(directory / "module-info.java", ec) ||
           fs::is_regular_file(directory / "module-info.class", ec);
}

} // namespace

Workspace::Workspace(WorkspaceOptions options)
    : options_(std::move(options)), repository_(options_.fuzzy),
      output_(repository_, options_.output_strategy), diagnostics_(options_.tracing) {
    JIG_LOG_DEBUG("vfs", "Opened workspace " << options_.name << " (outputs: "
                                             << path_strategy_name(options_.output_strategy)
                                             << ")");
}

Workspace::~Workspace() {
    try {
        close();
    } catch (const std::exception& e) {
        JIG_LOG_ERROR("vfs", "Workspace " << options_.name << " did not close cleanly: "
                                          << e.what());
    }
}

// ============================================================================
// Configuration
// ============================================================================

Container& Workspace::add_container(const Location& location, Box<Container> container) {
    ensure_open("add a container");
    require_package_oriented(location);
    return repository_.package_group(location).add_container(std::move(container));
}

Container& Workspace::add_module_container(const Location& location, std::string_view module,
                                           Box<Container> container) {
    ensure_open("add a module container");
    require_module_oriented(location);
    return repository_.module_partition(location).get_or_create_module(module).add_container(
        std::move(container));
}

void Workspace::add_path(const Location& location, const fs::path& path) {
    ensure_open("add a path");
    if (!location.is_module_oriented()) {
        add_container(location, open_container(path));
        return;
    }

    // Module names are dotted ("com.example"), so only archives lose their extension.
    if (is_archive_path(path)) {
        add_module_path(location, path.stem().string(), path);
        return;
    }

    auto root = path.lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    std::error_code ec;
    if (fs::is_directory(root, ec) && is_module_root(root)) {
        add_module_path(location, root.filename().string(), root);
        return;
    }
    discover_modules(location, root);
}

void Workspace::discover_modules(const Location& location, const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw BackingStoreError(VfsError{VfsErrorKind::Io, "module root is not a directory",
                                         location.name(), "", root.string()});
    }

    std::vector<fs::path> candidates;
    for (auto it = fs::directory_iterator(root, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && is_module_root(it->path())) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        throw BackingStoreError(VfsError{VfsErrorKind::Io,
                                         "failed to scan for modules: " + ec.message(),
                                         location.name(), "", root.string()});
    }

    std::sort(candidates.begin(), candidates.end());
    if (candidates.empty()) {
        JIG_LOG_WARN("vfs", "No modules found below " << root.string() << " for "
                                                      << location.name());
    }
    for (const auto& candidate : candidates) {
        add_module_path(location, candidate.filename().string(), candidate);
    }
}

Container& Workspace::add_module_path(const Location& location, std::string_view module,
                                      const fs::path& path) {
    return add_module_container(location, module, open_container(path));
}

MemoryContainer& Workspace::create_memory_root(const Location& location, std::string_view name) {
    auto container = make_box<MemoryContainer>(std::string(name));
    auto& root = *container;
    add_container(location, std::move(container));
    return root;
}

MemoryContainer& Workspace::create_module_memory_root(const Location& location,
                                                      std::string_view module,
                                                      std::string_view name) {
    auto container = make_box<MemoryContainer>(std::string(name));
    auto& root = *container;
    add_module_container(location, module, std::move(container));
    return root;
}

// ============================================================================
// Groups
// ============================================================================

ContainerGroup& Workspace::package_group(const Location& location) {
    ensure_open("access a location");
    return repository_.package_group(location);
}

ContainerGroup* Workspace::find_package_group(const Location& location) const {
    return repository_.find_package_group(location);
}

ModulePartition& Workspace::module_partition(const Location& location) {
    ensure_open("access a location");
    return repository_.module_partition(location);
}

ModulePartition* Workspace::find_module_partition(const Location& location) const {
    return repository_.find_module_partition(location);
}

bool Workspace::has_location(const Location& location) const {
    return repository_.has_location(location);
}

std::vector<Location> Workspace::locations() const {
    return repository_.locations();
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<FileHandle> Workspace::resolve(const Location& location,
                                             std::string_view path) const {
    ensure_open("resolve a file");
    require_package_oriented(location);
    auto* group = repository_.find_package_group(location);
    return group ? group->resolve(path) : std::nullopt;
}

std::optional<FileHandle> Workspace::resolve(const Location& location, std::string_view module,
                                             std::string_view path) const {
    ensure_open("resolve a file");
    require_module_oriented(location);
    auto* group = repository_.find_module_group(location, module);
    return group ? group->resolve(path) : std::nullopt;
}

std::vector<FileHandle> Workspace::list_all(const Location& location) const {
    ensure_open("list files");
    if (!location.is_module_oriented()) {
        auto* group = repository_.find_package_group(location);
        return group ? group->list_all() : std::vector<FileHandle>{};
    }

    std::vector<FileHandle> result;
    if (auto* partition = repository_.find_module_partition(location)) {
        for (const auto& module : partition->modules()) {
            for (auto& handle : partition->find_module(module)->list_all()) {
                result.push_back(std::move(handle));
            }
        }
    }
    return result;
}

std::optional<FileHandle> Workspace::find_class(const Location& location,
                                                std::string_view binary_name,
                                                FileKind kind) const {
    ensure_open("find a class");
    require_package_oriented(location);
    auto* group = repository_.find_package_group(location);
    return group ? group->find_class(binary_name, kind) : std::nullopt;
}

std::vector<FileHandle> Workspace::list(const Location& location, std::string_view package,
                                        const std::set<FileKind>& kinds, bool recurse) const {
    ensure_open("list a package");
    require_package_oriented(location);
    auto* group = repository_.find_package_group(location);
    return group ? group->list(package, kinds, recurse) : std::vector<FileHandle>{};
}

// ============================================================================
// Output
// ============================================================================

OutputAllocator& Workspace::output() {
    ensure_open("allocate output");
    return output_;
}

FileHandle Workspace::write_output(const Location& location, std::string_view path,
                                   const Bytes& contents) {
    return output().write(location, path, contents);
}

FileHandle Workspace::write_output(const Location& location, std::string_view module,
                                   std::string_view path, const Bytes& contents) {
    return output().write(location, module, path, contents);
}

const ByteSource& Workspace::class_loader(const Location& location) {
    ensure_open("load classes");
    if (location.is_module_oriented()) {
        return repository_.module_partition(location).class_loader();
    }
    return repository_.package_group(location).class_loader();
}

// ============================================================================
// Assertion Support
// ============================================================================

std::vector<Suggestion> Workspace::suggest_files(const Location& location,
                                                 std::string_view path) const {
    if (!location.is_module_oriented()) {
        auto* group = repository_.find_package_group(location);
        return group ? group->suggest(path) : std::vector<Suggestion>{};
    }

    std::vector<std::string> candidates;
    for (const auto& handle : list_all(location)) {
        candidates.push_back(handle.relative_path());
    }
    return FuzzyMatcher(options_.fuzzy).rank(path, candidates);
}

std::vector<Suggestion> Workspace::suggest_modules(const Location& location,
                                                   std::string_view module) const {
    require_module_oriented(location);
    auto* partition = repository_.find_module_partition(location);
    return partition ? partition->suggest_modules(module) : std::vector<Suggestion>{};
}

std::string Workspace::describe_missing_file(const Location& location,
                                             std::string_view path) const {
    if (!location.is_module_oriented()) {
        if (auto* group = repository_.find_package_group(location)) {
            return group->describe_missing(path);
        }
    }
    return not_found_message("file", path, suggest_files(location, path)) + "\n  (in " +
           location.name() + ")";
}

std::string Workspace::describe_missing_module(const Location& location,
                                               std::string_view module) const {
    require_module_oriented(location);
    if (auto* partition = repository_.find_module_partition(location)) {
        return partition->describe_missing_module(module);
    }
    return not_found_message("module", module, {}) + "\n  (no modules in " + location.name() +
           ")";
}

std::string Workspace::dump() const {
    std::ostringstream out;
    out << "Workspace " << options_.name << "\n";

    for (const auto& location : repository_.locations()) {
        out << location.name() << (location.is_output() ? " (output)" : "") << ":\n";
        if (auto* group = repository_.find_package_group(location)) {
            out << (group->empty() ? "  (no containers)\n" : render_tree(*group));
        }
        if (auto* partition = repository_.find_module_partition(location)) {
            for (const auto& module : partition->modules()) {
                out << "  module " << module << ":\n" << render_tree(*partition->find_module(module));
            }
        }
    }

    out << "Diagnostics: " << diagnostics_.size() << "\n";
    return out.str();
}

// ============================================================================
// Teardown
// ============================================================================

void Workspace::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    diagnostics_.close();
    repository_.close();
    JIG_LOG_DEBUG("vfs", "Closed workspace " << options_.name);
}

void Workspace::ensure_open(std::string_view operation) const {
    if (is_closed()) {
        throw UsageError("cannot " + std::string(operation) + " in closed workspace " +
                         util::quoted(options_.name));
    }
}

void Workspace::require_package_oriented(const Location& location) {
    if (location.is_module_oriented()) {
        throw UsageError("location " + location.name() +
                         " is module-oriented, a module name is required");
    }
}

void Workspace::require_module_oriented(const Location& location) {
    if (!location.is_module_oriented()) {
        throw UsageError("location " + location.name() +
                         " is not module-oriented, module operations are not allowed");
    }
}

} // namespace jig::vfs
