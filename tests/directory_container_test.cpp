//! # Directory Container Tests

#include "vfs/directory_container.hpp"
#include "vfs/errors.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace jig;
using namespace jig::vfs;
namespace fs = std::filesystem;

class DirectoryContainerTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / "jig_directory_container_test";
        fs::remove_all(dir);
        fs::create_directories(dir / "com" / "example");
        std::ofstream(dir / "com" / "example" / "Foo.java") << "class Foo {}";
        std::ofstream(dir / "build.properties") << "x=1";
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

TEST_F(DirectoryContainerTest, ReadsExistingFiles) {
    DirectoryContainer container(dir, false);

    EXPECT_EQ(container.name(), "jig_directory_container_test");
    EXPECT_EQ(container.kind(), ContainerKind::Directory);
    EXPECT_TRUE(container.exists("com/example/Foo.java"));
    EXPECT_FALSE(container.exists("com/example"));
    EXPECT_TRUE(container.is_directory("com/example"));
    EXPECT_EQ(to_string(*container.read("com/example/Foo.java")), "class Foo {}");
    EXPECT_FALSE(container.read("com/example/Bar.java").has_value());
}

TEST_F(DirectoryContainerTest, ListAllIsSortedAndRelative) {
    DirectoryContainer container(dir, false);

    std::vector<std::string> expected = {"build.properties", "com/example/Foo.java"};
    EXPECT_EQ(container.list_all(), expected);
}

TEST_F(DirectoryContainerTest, ReadOnlyRejectsWrites) {
    DirectoryContainer container(dir, false);
    EXPECT_THROW(container.write("New.java", to_bytes("x")), UsageError);
}

TEST_F(DirectoryContainerTest, WritableCreatesParents) {
    DirectoryContainer container(dir, true);

    auto handle = container.write("out/com/example/Foo.class", to_bytes("CAFEBABE"));

    EXPECT_EQ(handle.kind(), FileKind::Class);
    EXPECT_TRUE(fs::is_regular_file(dir / "out" / "com" / "example" / "Foo.class"));
    EXPECT_EQ(handle.read_text(), "CAFEBABE");
}

TEST_F(DirectoryContainerTest, WriteOverDirectoryConflicts) {
    DirectoryContainer container(dir, true);

    try {
        container.write("com/example", to_bytes("x"));
        FAIL() << "expected a conflict";
    } catch (const BackingStoreError& e) {
        EXPECT_EQ(e.error().kind, VfsErrorKind::Conflict);
    }
}

TEST_F(DirectoryContainerTest, MissingRootIsABackingStoreError) {
    EXPECT_THROW(DirectoryContainer(dir / "missing", false), BackingStoreError);
}

TEST_F(DirectoryContainerTest, CloseKeepsUnownedDirectory) {
    {
        DirectoryContainer container(dir, true);
        container.close();
        EXPECT_THROW(container.list_all(), UsageError);
    }
    EXPECT_TRUE(fs::exists(dir / "build.properties"));
}

// ============================================================================
// Temporary Directories
// ============================================================================

TEST(TemporaryDirectoryTest, RemovedOnClose) {
    auto container = DirectoryContainer::create_temporary("CLASS_OUTPUT");
    auto root = container->root();

    EXPECT_TRUE(container->owns_root());
    EXPECT_TRUE(container->is_writable());
    EXPECT_EQ(container->name(), "CLASS_OUTPUT");
    EXPECT_EQ(root.filename().string().rfind("jig-CLASS_OUTPUT-", 0), 0u);

    container->write("a/b.txt", to_bytes("x"));
    EXPECT_TRUE(fs::exists(root / "a" / "b.txt"));

    container->close();
    EXPECT_FALSE(fs::exists(root));
}

TEST(TemporaryDirectoryTest, RemovedOnDestruction) {
    fs::path root;
    {
        auto container = DirectoryContainer::create_temporary("scratch");
        root = container->root();
        EXPECT_TRUE(fs::is_directory(root));
    }
    EXPECT_FALSE(fs::exists(root));
}

TEST(TemporaryDirectoryTest, DistinctRoots) {
    auto a = DirectoryContainer::create_temporary("same");
    auto b = DirectoryContainer::create_temporary("same");
    EXPECT_NE(a->root(), b->root());
}
