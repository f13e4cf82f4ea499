//! # Archive Container Tests
//!
//! Fixtures are built in-process: entries are stored or raw-deflated with
//! zlib and wrapped in local headers, a central directory and an end record,
//! then read back through minizip by ArchiveContainer.

#include "vfs/archive_container.hpp"
#include "vfs/errors.hpp"

#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace jig;
using namespace jig::vfs;
namespace fs = std::filesystem;

namespace {

class ZipBuilder {
public:
    ZipBuilder& stored(const std::string& name, const std::string& data, uint16_t flags = 0) {
        return add(name, to_bytes(data), to_bytes(data), 0, flags);
    }

    ZipBuilder& deflated(const std::string& name, const std::string& data) {
        return add(name, to_bytes(data), deflate_raw(to_bytes(data)), 8, 0);
    }

    ZipBuilder& directory(const std::string& name) {
        return add(name, {}, {}, 0, 0);
    }

    /// Overrides the checksum recorded for the most recent entry.
    ZipBuilder& corrupt_crc() {
        entries_.back().crc ^= 0xFFFFFFFFu;
        return *this;
    }

    /// Overrides the uncompressed size recorded for the most recent entry.
    ZipBuilder& declared_size(uint32_t size) {
        entries_.back().size = size;
        return *this;
    }

    Bytes build() const {
        Bytes out;
        std::vector<uint32_t> offsets;
        for (const auto& e : entries_) {
            offsets.push_back(static_cast<uint32_t>(out.size()));
            put32(out, 0x04034b50);
            put16(out, 20);
            put16(out, e.flags);
            put16(out, e.method);
            put16(out, 0);
            put16(out, 0);
            put32(out, e.crc);
            put32(out, static_cast<uint32_t>(e.data.size()));
            put32(out, e.size);
            put16(out, static_cast<uint16_t>(e.name.size()));
            put16(out, 0);
            out.insert(out.end(), e.name.begin(), e.name.end());
            out.insert(out.end(), e.data.begin(), e.data.end());
        }

        auto directory_offset = static_cast<uint32_t>(out.size());
        for (size_t i = 0; i < entries_.size(); ++i) {
            const auto& e = entries_[i];
            put32(out, 0x02014b50);
            put16(out, 20);
            put16(out, 20);
            put16(out, e.flags);
            put16(out, e.method);
            put16(out, 0);
            put16(out, 0);
            put32(out, e.crc);
            put32(out, static_cast<uint32_t>(e.data.size()));
            put32(out, e.size);
            put16(out, static_cast<uint16_t>(e.name.size()));
            put16(out, 0);
            put16(out, 0);
            put16(out, 0);
            put16(out, 0);
            put32(out, 0);
            put32(out, offsets[i]);
            out.insert(out.end(), e.name.begin(), e.name.end());
        }
        auto directory_size = static_cast<uint32_t>(out.size()) - directory_offset;

        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<uint16_t>(entries_.size()));
        put16(out, static_cast<uint16_t>(entries_.size()));
        put32(out, directory_size);
        put32(out, directory_offset);
        put16(out, 0);
        return out;
    }

    void write_to(const fs::path& path) const {
        auto bytes = build();
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

private:
    struct Pending {
        std::string name;
        Bytes data;
        uint32_t crc;
        uint32_t size;
        uint16_t method;
        uint16_t flags;
    };

    ZipBuilder& add(const std::string& name, const Bytes& raw, Bytes data, uint16_t method,
                    uint16_t flags) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, raw.data(), static_cast<uInt>(raw.size()));
        entries_.push_back({name, std::move(data), static_cast<uint32_t>(crc),
                            static_cast<uint32_t>(raw.size()), method, flags});
        return *this;
    }

    static Bytes deflate_raw(const Bytes& input) {
        z_stream stream{};
        EXPECT_EQ(deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                               Z_DEFAULT_STRATEGY),
                  Z_OK);

        Bytes output(deflateBound(&stream, static_cast<uLong>(input.size())) + 16);
        stream.next_in = const_cast<Bytef*>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());
        stream.next_out = output.data();
        stream.avail_out = static_cast<uInt>(output.size());

        EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
        output.resize(stream.total_out);
        deflateEnd(&stream);
        return output;
    }

    static void put16(Bytes& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        out.push_back(static_cast<uint8_t>(value >> 8));
    }

    static void put32(Bytes& out, uint32_t value) {
        put16(out, static_cast<uint16_t>(value & 0xFFFF));
        put16(out, static_cast<uint16_t>(value >> 16));
    }

    std::vector<Pending> entries_;
};

} // namespace

class ArchiveContainerTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path jar;

    void SetUp() override {
        dir = fs::temp_directory_path() / "jig_archive_container_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
        jar = dir / "lib.jar";
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

// ============================================================================
// Reading Entries
// ============================================================================

TEST_F(ArchiveContainerTest, ReadsStoredAndDeflatedEntries) {
    std::string repeated(4096, 'a');
    ZipBuilder()
        .directory("META-INF/")
        .stored("META-INF/MANIFEST.MF", "Manifest-Version: 1.0\n")
        .deflated("com/example/Foo.class", repeated)
        .deflated("empty.txt", "")
        .write_to(jar);

    ArchiveContainer archive(jar);

    EXPECT_EQ(archive.kind(), ContainerKind::Archive);
    EXPECT_FALSE(archive.is_writable());
    EXPECT_EQ(archive.name(), "lib.jar");
    EXPECT_EQ(archive.entry_count(), 3u);
    EXPECT_EQ(to_string(*archive.read("META-INF/MANIFEST.MF")), "Manifest-Version: 1.0\n");
    EXPECT_EQ(to_string(*archive.read("com/example/Foo.class")), repeated);
    EXPECT_TRUE(archive.read("empty.txt")->empty());
}

TEST_F(ArchiveContainerTest, DirectoriesAreNotFiles) {
    ZipBuilder().directory("META-INF/").stored("com/example/Foo.class", "x").write_to(jar);

    ArchiveContainer archive(jar);

    EXPECT_TRUE(archive.is_directory("META-INF"));
    EXPECT_TRUE(archive.is_directory("com/example"));
    EXPECT_FALSE(archive.exists("META-INF"));
    EXPECT_TRUE(archive.exists("com/example/Foo.class"));
    EXPECT_FALSE(archive.read("com/example/Bar.class").has_value());
}

TEST_F(ArchiveContainerTest, ListAllIsSorted) {
    ZipBuilder().stored("b.txt", "").stored("a/z.txt", "").stored("a/b.txt", "").write_to(jar);

    ArchiveContainer archive(jar);

    std::vector<std::string> expected = {"a/b.txt", "a/z.txt", "b.txt"};
    EXPECT_EQ(archive.list_all(), expected);
}

TEST_F(ArchiveContainerTest, FirstDuplicateWinsAndMalformedNamesAreSkipped) {
    ZipBuilder()
        .stored("a.txt", "first")
        .stored("a.txt", "second")
        .stored("../evil.txt", "x")
        .directory("/")
        .stored("com//x.txt", "y")
        .write_to(jar);

    ArchiveContainer archive(jar);

    EXPECT_EQ(archive.entry_count(), 2u);
    EXPECT_EQ(to_string(*archive.read("a.txt")), "first");
    EXPECT_EQ(to_string(*archive.read("com/x.txt")), "y");
    EXPECT_FALSE(archive.exists(""));

    std::vector<std::string> expected = {"a.txt", "com/x.txt"};
    EXPECT_EQ(archive.list_all(), expected);
}

TEST_F(ArchiveContainerTest, HandleUriIncludesArchivePath) {
    ZipBuilder().stored("Foo.class", "x").write_to(jar);

    ArchiveContainer archive(jar);
    auto handle = archive.find("Foo.class");

    ASSERT_TRUE(handle.has_value());
    EXPECT_NE(handle->uri().find("lib.jar!/Foo.class"), std::string::npos);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ArchiveContainerTest, ChecksumMismatchIsCorrupt) {
    ZipBuilder().deflated("Foo.class", "payload").corrupt_crc().write_to(jar);

    ArchiveContainer archive(jar);
    try {
        archive.read("Foo.class");
        FAIL() << "expected a checksum error";
    } catch (const BackingStoreError& e) {
        EXPECT_EQ(e.error().kind, VfsErrorKind::Corrupt);
        EXPECT_NE(e.error().path.find("lib.jar!/Foo.class"), std::string::npos);
    }
}

TEST_F(ArchiveContainerTest, OversizedRecordedSizeIsCorruptNotAllocated) {
    ZipBuilder().stored("Huge.class", "tiny").declared_size(0x7FFFFFF0u).write_to(jar);

    ArchiveContainer archive(jar);
    try {
        archive.read("Huge.class");
        FAIL() << "expected a size mismatch";
    } catch (const BackingStoreError& e) {
        EXPECT_EQ(e.error().kind, VfsErrorKind::Corrupt);
        EXPECT_NE(e.error().message.find("2147483632"), std::string::npos);
    }
}

TEST_F(ArchiveContainerTest, EncryptedEntriesAreUnsupported) {
    ZipBuilder().stored("Secret.class", "x", 0x0001).write_to(jar);

    ArchiveContainer archive(jar);
    EXPECT_TRUE(archive.exists("Secret.class"));
    try {
        archive.read("Secret.class");
        FAIL() << "expected an unsupported entry";
    } catch (const BackingStoreError& e) {
        EXPECT_EQ(e.error().kind, VfsErrorKind::Unsupported);
    }
}

TEST_F(ArchiveContainerTest, GarbageIsNotAnArchive) {
    std::ofstream(jar, std::ios::binary) << "this is definitely not a zip file";

    try {
        ArchiveContainer archive(jar);
        FAIL() << "expected a corrupt archive";
    } catch (const BackingStoreError& e) {
        EXPECT_EQ(e.error().kind, VfsErrorKind::Corrupt);
        EXPECT_NE(e.error().path.find("lib.jar"), std::string::npos);
    }
}

TEST_F(ArchiveContainerTest, MissingFileIsAnIoError) {
    EXPECT_THROW(ArchiveContainer(dir / "missing.jar"), BackingStoreError);
}

TEST_F(ArchiveContainerTest, WritesAreRejected) {
    ZipBuilder().stored("Foo.class", "x").write_to(jar);

    ArchiveContainer archive(jar);
    EXPECT_THROW(archive.write("Bar.class", to_bytes("y")), UsageError);
}

TEST_F(ArchiveContainerTest, CloseBlocksReads) {
    ZipBuilder().stored("Foo.class", "x").write_to(jar);

    ArchiveContainer archive(jar);
    archive.close();
    EXPECT_THROW(archive.read("Foo.class"), UsageError);
}

// ============================================================================
// open_container
// ============================================================================

TEST_F(ArchiveContainerTest, OpenContainerDispatchesOnExtension) {
    ZipBuilder().stored("Foo.class", "x").write_to(jar);

    auto archive = open_container(jar);
    EXPECT_EQ(archive->kind(), ContainerKind::Archive);

    auto directory = open_container(dir);
    EXPECT_EQ(directory->kind(), ContainerKind::Directory);

    EXPECT_THROW(open_container(jar, true), UsageError);
}
