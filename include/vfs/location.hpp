//! # Locations
//!
//! A `Location` names a logical compiler search or output path ("where
//! sources live", "where class output goes"). Locations are immutable
//! identity values compared by name.
//!
//! A module-oriented location is subdivided into modules. Each module gets
//! a derived location named `PARENT[module]`, which is package-oriented.

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace jig::vfs {

class Location {
public:
    Location(std::string name, bool is_output, bool is_module_oriented);

    /// Location of module `module` inside the module-oriented `parent`.
    /// Throws `UsageError` if `parent` is not module-oriented.
    static Location for_module(const Location& parent, std::string_view module);

    const std::string& name() const {
        return name_;
    }

    bool is_output() const {
        return is_output_;
    }

    bool is_module_oriented() const {
        return is_module_oriented_;
    }

    /// True for locations produced by `for_module`.
    bool is_module_location() const {
        return !module_name_.empty();
    }

    /// Module name, empty unless this is a module location.
    const std::string& module_name() const {
        return module_name_;
    }

    /// Name of the module-oriented parent, empty unless this is a module location.
    const std::string& parent_name() const {
        return parent_name_;
    }

    bool operator==(const Location& other) const {
        return name_ == other.name_;
    }

    bool operator!=(const Location& other) const {
        return !(*this == other);
    }

    bool operator<(const Location& other) const {
        return name_ < other.name_;
    }

private:
    std::string name_;
    bool is_output_;
    bool is_module_oriented_;
    std::string module_name_;
    std::string parent_name_;
};

struct LocationHash {
    size_t operator()(const Location& location) const {
        return std::hash<std::string>{}(location.name());
    }
};

// ============================================================================
// Standard Locations
// ============================================================================

namespace locations {

// Output locations
extern const Location CLASS_OUTPUT;
extern const Location SOURCE_OUTPUT;
extern const Location NATIVE_HEADER_OUTPUT;
/// Module-oriented class output, used for multi-module compilations.
extern const Location MODULE_CLASS_OUTPUT;

// Package-oriented input locations
extern const Location CLASS_PATH;
extern const Location SOURCE_PATH;
extern const Location ANNOTATION_PROCESSOR_PATH;
extern const Location PLATFORM_CLASS_PATH;

// Module-oriented input locations
extern const Location MODULE_SOURCE_PATH;
extern const Location MODULE_PATH;
extern const Location UPGRADE_MODULE_PATH;
extern const Location SYSTEM_MODULES;
extern const Location PATCH_MODULE_PATH;
extern const Location ANNOTATION_PROCESSOR_MODULE_PATH;

/// Every standard location above, outputs first.
const std::vector<Location>& standard();

} // namespace locations

} // namespace jig::vfs
