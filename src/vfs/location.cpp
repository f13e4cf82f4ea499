//! # Locations Implementation

#include "vfs/location.hpp"

#include "vfs/errors.hpp"

namespace jig::vfs {

Location::Location(std::string name, bool is_output, bool is_module_oriented)
    : name_(std::move(name)), is_output_(is_output), is_module_oriented_(is_module_oriented) {
    if (name_.empty()) {
        throw UsageError("location name must not be empty");
    }
}

Location Location::for_module(const Location& parent, std::string_view module) {
    if (!parent.is_module_oriented()) {
        throw UsageError("location " + parent.name() + " is not module-oriented, cannot derive module " +
                         std::string(module));
    }
    if (module.empty()) {
        throw UsageError("module name must not be empty for location " + parent.name());
    }

    Location location(parent.name() + "[" + std::string(module) + "]", parent.is_output(), false);
    location.module_name_ = std::string(module);
    location.parent_name_ = parent.name();
    return location;
}

namespace locations {

const Location CLASS_OUTPUT{"CLASS_OUTPUT", true, false};
const Location SOURCE_OUTPUT{"SOURCE_OUTPUT", true, false};
const Location NATIVE_HEADER_OUTPUT{"NATIVE_HEADER_OUTPUT", true, false};
const Location MODULE_CLASS_OUTPUT{"MODULE_CLASS_OUTPUT", true, true};

const Location CLASS_PATH{"CLASS_PATH", false, false};
const Location SOURCE_PATH{"SOURCE_PATH", false, false};
const Location ANNOTATION_PROCESSOR_PATH{"ANNOTATION_PROCESSOR_PATH", false, false};
const Location PLATFORM_CLASS_PATH{"PLATFORM_CLASS_PATH", false, false};

const Location MODULE_SOURCE_PATH{"MODULE_SOURCE_PATH", false, true};
const Location MODULE_PATH{"MODULE_PATH", false, true};
const Location UPGRADE_MODULE_PATH{"UPGRADE_MODULE_PATH", false, true};
const Location SYSTEM_MODULES{"SYSTEM_MODULES", false, true};
const Location PATCH_MODULE_PATH{"PATCH_MODULE_PATH", false, true};
const Location ANNOTATION_PROCESSOR_MODULE_PATH{"ANNOTATION_PROCESSOR_MODULE_PATH", false, true};

const std::vector<Location>& standard() {
    static const std::vector<Location> all = {
        CLASS_OUTPUT,
        SOURCE_OUTPUT,
        NATIVE_HEADER_OUTPUT,
        MODULE_CLASS_OUTPUT,
        CLASS_PATH,
        SOURCE_PATH,
        ANNOTATION_PROCESSOR_PATH,
        PLATFORM_CLASS_PATH,
        MODULE_SOURCE_PATH,
        MODULE_PATH,
        UPGRADE_MODULE_PATH,
        SYSTEM_MODULES,
        PATCH_MODULE_PATH,
        ANNOTATION_PROCESSOR_MODULE_PATH,
    };
    return all;
}

} // namespace locations

} // namespace jig::vfs
