//! # In-Memory Container Tests

#include "vfs/errors.hpp"
#include "vfs/memory_container.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace jig;
using namespace jig::vfs;
namespace fs = std::filesystem;

class MemoryContainerTest : public ::testing::Test {
protected:
    MemoryContainer root{"sources"};
};

// ============================================================================
// Reading and Writing
// ============================================================================

TEST_F(MemoryContainerTest, WriteThenRead) {
    auto handle = root.write("com/example/Foo.java", to_bytes("class Foo {}"));

    EXPECT_EQ(handle.relative_path(), "com/example/Foo.java");
    EXPECT_EQ(handle.kind(), FileKind::Source);
    EXPECT_EQ(handle.read_text(), "class Foo {}");
    EXPECT_TRUE(root.exists("com/example/Foo.java"));
    EXPECT_TRUE(root.is_directory("com/example"));
    EXPECT_TRUE(root.is_directory("com"));
    EXPECT_FALSE(root.exists("com/example"));
}

TEST_F(MemoryContainerTest, PathsAreNormalized) {
    root.create_file("/com//example/./Foo.java", "x");

    EXPECT_TRUE(root.exists("com/example/Foo.java"));
    ASSERT_TRUE(root.find("./com/example/Foo.java").has_value());
    EXPECT_EQ(root.find("com/example/Foo.java")->relative_path(), "com/example/Foo.java");
}

TEST_F(MemoryContainerTest, OverwriteReplacesContents) {
    root.create_file("a.txt", "one").create_file("a.txt", "two");

    EXPECT_EQ(to_string(*root.read("a.txt")), "two");
    EXPECT_EQ(root.file_count(), 1u);
}

TEST_F(MemoryContainerTest, MissingFilesAreNotErrors) {
    EXPECT_FALSE(root.exists("nope.txt"));
    EXPECT_FALSE(root.read("nope.txt").has_value());
    EXPECT_FALSE(root.find("nope.txt").has_value());
}

TEST_F(MemoryContainerTest, EscapingPathsAreNeverFound) {
    EXPECT_FALSE(root.exists("../outside.txt"));
    EXPECT_FALSE(root.exists(""));
    EXPECT_THROW(root.write("../outside.txt", to_bytes("x")), UsageError);
}

TEST_F(MemoryContainerTest, ListAllIsSorted) {
    root.create_file("b/B.java", "").create_file("a/A.java", "").create_file("Top.java", "");
    root.create_directory("empty/dir");

    std::vector<std::string> expected = {"Top.java", "a/A.java", "b/B.java"};
    EXPECT_EQ(root.list_all(), expected);
    EXPECT_TRUE(root.is_directory("empty/dir"));
}

// ============================================================================
// Conflicts
// ============================================================================

TEST_F(MemoryContainerTest, FileOverDirectoryConflicts) {
    root.create_file("com/example/Foo.java", "");

    try {
        root.write("com/example", to_bytes("x"));
        FAIL() << "expected a conflict";
    } catch (const BackingStoreError& e) {
        EXPECT_EQ(e.error().kind, VfsErrorKind::Conflict);
        EXPECT_EQ(e.error().path, "com/example");
    }
}

TEST_F(MemoryContainerTest, FileBelowFileConflicts) {
    root.create_file("notes", "");
    EXPECT_THROW(root.write("notes/today.txt", to_bytes("x")), BackingStoreError);
    EXPECT_THROW(root.create_directory("notes"), BackingStoreError);
}

// ============================================================================
// Identity and Lifecycle
// ============================================================================

TEST(MemoryContainerIdentityTest, RootIdsAreUnique) {
    MemoryContainer a("same");
    MemoryContainer b("same");

    EXPECT_NE(a.root_id(), b.root_id());
    EXPECT_EQ(a.root_id().rfind("memory://same-", 0), 0u);
    EXPECT_EQ(a.kind(), ContainerKind::Memory);
    EXPECT_TRUE(a.is_writable());

    auto handle = a.write_text("Foo.java", "");
    EXPECT_EQ(handle.uri(), a.root_id() + "!/Foo.java");
}

TEST(MemoryContainerIdentityTest, InvalidNamesAreRejected) {
    EXPECT_THROW(MemoryContainer(""), UsageError);
    EXPECT_THROW(MemoryContainer("a/b"), UsageError);
}

TEST_F(MemoryContainerTest, CloseIsIdempotentAndBlocksUse) {
    root.create_file("a.txt", "x");

    root.close();
    root.close();

    EXPECT_TRUE(root.is_closed());
    EXPECT_THROW(root.read("a.txt"), UsageError);
    EXPECT_THROW(root.exists("a.txt"), UsageError);
    EXPECT_THROW(root.write("b.txt", to_bytes("y")), UsageError);
}

TEST_F(MemoryContainerTest, CopyFromRealDirectory) {
    auto source = fs::temp_directory_path() / "jig_memory_copy_test";
    fs::remove_all(source);
    fs::create_directories(source / "pkg");
    std::ofstream(source / "pkg" / "A.java") << "class A {}";
    std::ofstream(source / "readme.txt") << "hello";

    root.copy_from(source, "imported");
    fs::remove_all(source);

    EXPECT_EQ(to_string(*root.read("imported/pkg/A.java")), "class A {}");
    EXPECT_EQ(to_string(*root.read("imported/readme.txt")), "hello");
}
