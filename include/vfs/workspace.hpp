//! # Workspace
//!
//! The virtual compilation workspace: one object that owns every location's
//! containers, the output allocator and the diagnostic collector of a
//! compilation run, and serves as the file manager of a hosted compiler.
//!
//! ## Overview
//!
//! ```cpp
//! Workspace ws;
//! ws.create_memory_root(locations::SOURCE_PATH, "sources")
//!     .create_file("com/example/Foo.java", "package com.example; class Foo {}");
//!
//! auto source = ws.resolve(locations::SOURCE_PATH, "com/example/Foo.java");
//! ws.write_output(locations::CLASS_OUTPUT, "com/example/Foo.class", bytes);
//! ws.diagnostics().record(diagnostic);
//!
//! for (const auto& d : ws.diagnostics().drain()) {
//!     std::cerr << diag::format_trace_diagnostic(d) << "\n";
//! }
//! ```
//!
//! ## Phases
//!
//! Configuration (`add_*`, `create_*`) and querying are expected not to
//! overlap, although every structure is internally synchronized.
//!
//! ## Teardown
//!
//! `close()` closes the diagnostic collector and every container, then
//! reports all failures at once. The destructor closes as well, logging
//! instead of throwing. Any use after close throws `UsageError`.

#pragma once

#include "diag/trace_collector.hpp"
#include "vfs/group_repository.hpp"
#include "vfs/memory_container.hpp"
#include "vfs/output_allocator.hpp"

#include <atomic>
#include <filesystem>
#include <set>

namespace jig::vfs {

/// Configuration of a workspace.
struct WorkspaceOptions {
    std::string name = "workspace";                       ///< Used in logs and dumps
    FuzzyOptions fuzzy;                                   ///< Suggestion ranking
    PathStrategy output_strategy = PathStrategy::Memory;  ///< Backing of output containers
    diag::TraceOptions tracing;                           ///< Diagnostic capture
};

class Workspace {
public:
    explicit Workspace(WorkspaceOptions options = {});
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const WorkspaceOptions& options() const {
        return options_;
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Appends `container` to a package-oriented location.
    Container& add_container(const Location& location, Box<Container> container);

    /// Appends `container` to module `module` of a module-oriented location.
    Container& add_module_container(const Location& location, std::string_view module,
                                    Box<Container> container);

    /// Adds a directory or archive.
    ///
    /// For a module-oriented location, `path` is scanned for modules: each
    /// immediate subdirectory holding `module-info.java` or
    /// `module-info.class` becomes a module named after the subdirectory. A
    /// path that is itself a module root, or an archive, is added as one
    /// module named after its file stem.
    void add_path(const Location& location, const std::filesystem::path& path);

    /// Adds a directory or archive to module `module`.
    Container& add_module_path(const Location& location, std::string_view module,
                               const std::filesystem::path& path);

    /// Creates and adds an empty in-memory root to a package-oriented location.
    MemoryContainer& create_memory_root(const Location& location, std::string_view name);

    /// Creates and adds an empty in-memory root to a module.
    MemoryContainer& create_module_memory_root(const Location& location, std::string_view module,
                                               std::string_view name);

    // ========================================================================
    // Groups
    // ========================================================================

    ContainerGroup& package_group(const Location& location);
    ContainerGroup* find_package_group(const Location& location) const;
    ModulePartition& module_partition(const Location& location);
    ModulePartition* find_module_partition(const Location& location) const;

    bool has_location(const Location& location) const;

    /// Every configured location, sorted by name.
    std::vector<Location> locations() const;

    // ========================================================================
    // Lookup
    // ========================================================================

    /// Resolves `path` in a package-oriented location.
    std::optional<FileHandle> resolve(const Location& location, std::string_view path) const;

    /// Resolves `path` in module `module` of a module-oriented location.
    std::optional<FileHandle> resolve(const Location& location, std::string_view module,
                                      std::string_view path) const;

    /// Every file of a location; for module-oriented locations every module
    /// in name order.
    std::vector<FileHandle> list_all(const Location& location) const;

    std::optional<FileHandle> find_class(const Location& location, std::string_view binary_name,
                                         FileKind kind) const;

    std::vector<FileHandle> list(const Location& location, std::string_view package,
                                 const std::set<FileKind>& kinds, bool recurse) const;

    // ========================================================================
    // Output
    // ========================================================================

    OutputAllocator& output();

    FileHandle write_output(const Location& location, std::string_view path,
                            const Bytes& contents);

    FileHandle write_output(const Location& location, std::string_view module,
                            std::string_view path, const Bytes& contents);

    /// Live class-loading view of any location.
    const ByteSource& class_loader(const Location& location);

    // ========================================================================
    // Assertion Support
    // ========================================================================

    std::vector<Suggestion> suggest_files(const Location& location, std::string_view path) const;

    std::vector<Suggestion> suggest_modules(const Location& location,
                                            std::string_view module) const;

    /// "No file matching ... was found" with suggestions.
    std::string describe_missing_file(const Location& location, std::string_view path) const;

    /// "No module matching ... was found" with suggestions.
    std::string describe_missing_module(const Location& location, std::string_view module) const;

    /// Collector receiving the diagnostics of this run.
    diag::DiagnosticTraceCollector& diagnostics() {
        return diagnostics_;
    }

    const diag::DiagnosticTraceCollector& diagnostics() const {
        return diagnostics_;
    }

    /// Tree rendering of every location, for failure reports.
    std::string dump() const;

    // ========================================================================
    // Teardown
    // ========================================================================

    /// Closes the collector and every container. Throws `BackingStoreError`
    /// listing every failure, after all resources were attempted.
    void close();

    bool is_closed() const {
        return closed_.load(std::memory_order_acquire);
    }

private:
    void ensure_open(std::string_view operation) const;

    /// Throws `UsageError` unless `location` is package-oriented.
    static void require_package_oriented(const Location& location);

    /// Throws `UsageError` unless `location` is module-oriented.
    static void require_module_oriented(const Location& location);

    /// Adds every module found below `root`.
    void discover_modules(const Location& location, const std::filesystem::path& root);

    WorkspaceOptions options_;
    GroupRepository repository_;
    OutputAllocator output_;
    diag::DiagnosticTraceCollector diagnostics_;
    std::atomic<bool> closed_{false};
};

} // namespace jig::vfs
