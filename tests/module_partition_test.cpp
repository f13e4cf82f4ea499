//! # Module Partition and Repository Tests

#include "vfs/errors.hpp"
#include "vfs/group_repository.hpp"
#include "vfs/memory_container.hpp"

#include <gtest/gtest.h>

using namespace jig;
using namespace jig::vfs;

class ModulePartitionTest : public ::testing::Test {
protected:
    ModulePartition partition{locations::MODULE_SOURCE_PATH};

    MemoryContainer& add_root(std::string_view module, std::string_view name) {
        return static_cast<MemoryContainer&>(partition.get_or_create_module(module).add_container(
            make_box<MemoryContainer>(std::string(name))));
    }
};

// ============================================================================
// Modules
// ============================================================================

TEST_F(ModulePartitionTest, ModulesAreIsolated) {
    add_root("app", "app-src").create_file("com/app/Main.java", "app");
    add_root("lib", "lib-src").create_file("com/lib/Util.java", "lib");

    EXPECT_TRUE(partition.resolve("app", "com/app/Main.java").has_value());
    EXPECT_FALSE(partition.resolve("app", "com/lib/Util.java").has_value());
    EXPECT_TRUE(partition.resolve("lib", "com/lib/Util.java").has_value());
    EXPECT_FALSE(partition.resolve("missing", "com/lib/Util.java").has_value());
}

TEST_F(ModulePartitionTest, GetOrCreateReturnsSameGroup) {
    auto& a = partition.get_or_create_module("app");
    auto& b = partition.get_or_create_module("app");

    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.location().name(), "MODULE_SOURCE_PATH[app]");
    EXPECT_EQ(partition.find_module("app"), &a);
    EXPECT_EQ(partition.find_module("App"), nullptr);
}

TEST_F(ModulePartitionTest, ModulesAreSortedByName) {
    partition.get_or_create_module("zeta");
    partition.get_or_create_module("alpha");
    partition.get_or_create_module("mid");

    std::vector<std::string> expected = {"alpha", "mid", "zeta"};
    EXPECT_EQ(partition.modules(), expected);
    EXPECT_EQ(partition.module_locations()[0].name(), "MODULE_SOURCE_PATH[alpha]");
}

TEST_F(ModulePartitionTest, ClassLoaderSearchesEveryModule) {
    add_root("lib", "lib-out").create_file("com/lib/Util.class", "util");
    const auto& loader = partition.class_loader();

    EXPECT_EQ(to_string(*loader.fetch("com.lib.Util")), "util");
    EXPECT_FALSE(loader.can_load("com.app.Main"));

    add_root("app", "app-out").create_file("com/app/Main.class", "main");
    EXPECT_TRUE(loader.can_load("com.app.Main"));
}

TEST_F(ModulePartitionTest, DescribeMissingModule) {
    partition.get_or_create_module("com.example.app");
    partition.get_or_create_module("com.example.lib");

    auto message = partition.describe_missing_module("com.example.ap");

    EXPECT_NE(message.find("No module matching \"com.example.ap\" was found. Maybe you meant:\n"
                           "  - com.example.app"),
              std::string::npos);
    EXPECT_NE(message.find("(known modules in MODULE_SOURCE_PATH: com.example.app, com.example.lib)"),
              std::string::npos);
}

TEST_F(ModulePartitionTest, DescribeMissingModuleWithoutModules) {
    auto message = partition.describe_missing_module("app");

    EXPECT_EQ(message, "No module matching \"app\" was found. No similar results found.\n"
                       "  (known modules in MODULE_SOURCE_PATH: none)");
}

TEST(ModulePartitionConfigTest, RequiresModuleOrientedLocation) {
    EXPECT_THROW({ ModulePartition partition(locations::SOURCE_PATH); }, UsageError);
}

// ============================================================================
// GroupRepository
// ============================================================================

class GroupRepositoryTest : public ::testing::Test {
protected:
    GroupRepository repository;
};

TEST_F(GroupRepositoryTest, PackageGroupsAreCreatedOnce) {
    auto& a = repository.package_group(locations::CLASS_PATH);
    auto& b = repository.package_group(Location("CLASS_PATH", false, false));

    EXPECT_EQ(&a, &b);
    EXPECT_EQ(repository.find_package_group(locations::CLASS_PATH), &a);
    EXPECT_EQ(repository.find_package_group(locations::SOURCE_PATH), nullptr);
}

TEST_F(GroupRepositoryTest, OrientationIsEnforced) {
    EXPECT_THROW(repository.package_group(locations::MODULE_PATH), UsageError);
    EXPECT_THROW(repository.module_partition(locations::CLASS_PATH), UsageError);
    EXPECT_THROW(repository.package_group(Location::for_module(locations::MODULE_PATH, "app")),
                 UsageError);
}

TEST_F(GroupRepositoryTest, LocationsAreSorted) {
    repository.package_group(locations::SOURCE_PATH);
    repository.module_partition(locations::MODULE_PATH);
    repository.package_group(locations::CLASS_PATH);

    auto all = repository.locations();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0], locations::CLASS_PATH);
    EXPECT_EQ(all[1], locations::MODULE_PATH);
    EXPECT_EQ(all[2], locations::SOURCE_PATH);
    EXPECT_TRUE(repository.has_location(locations::MODULE_PATH));
    EXPECT_FALSE(repository.has_location(locations::SYSTEM_MODULES));
}

TEST_F(GroupRepositoryTest, FindModuleGroup) {
    auto& group = repository.module_partition(locations::MODULE_PATH).get_or_create_module("app");

    EXPECT_EQ(repository.find_module_group(locations::MODULE_PATH, "app"), &group);
    EXPECT_EQ(repository.find_module_group(locations::MODULE_PATH, "lib"), nullptr);
    EXPECT_EQ(repository.find_module_group(locations::UPGRADE_MODULE_PATH, "app"), nullptr);
}

TEST_F(GroupRepositoryTest, CloseClosesEveryContainer) {
    auto& source = repository.package_group(locations::SOURCE_PATH)
                       .add_container(make_box<MemoryContainer>("src"));
    auto& module = repository.module_partition(locations::MODULE_PATH)
                       .get_or_create_module("app")
                       .add_container(make_box<MemoryContainer>("app"));

    repository.close();

    EXPECT_TRUE(source.is_closed());
    EXPECT_TRUE(module.is_closed());
}
