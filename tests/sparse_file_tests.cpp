#include "cache/sparse_file.h"
#include "utilities/errors.h"
#include <cstdio>
#include <filesystem>
#include <gtest/gtest.h>
#include <sys/stat.h>

using namespace gutex;

class SparseFileTest : public ::testing::Test {
protected:
    std::string dir_;

    void SetUp() override {
        dir_ = (std::filesystem::temp_directory_path() / "gutex_sparse_file_tests").string();
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string path(const std::string &name) const { return dir_ + "/" + name; }
};

TEST_F(SparseFileTest, PreallocateCreatesSpecifiedSize) {
    const std::string file = path("prealloc.txt");
    preallocateFile(file, 1024);
    struct stat st {};
    ASSERT_EQ(::stat(file.c_str(), &st), 0);
    EXPECT_EQ(st.st_size, 1024);
}

TEST_F(SparseFileTest, PreallocateShrinksStaleFile) {
    const std::string file = path("stale.txt");
    preallocateFile(file, 4096);
    preallocateFile(file, 100);
    EXPECT_EQ(std::filesystem::file_size(file), 100u);
}

TEST_F(SparseFileTest, PreallocateInMissingDirectoryThrows) {
    EXPECT_THROW(preallocateFile(path("missing/dir/file.txt"), 10), CacheIoError);
}

TEST_F(SparseFileTest, WriteThenReadAtOffsets) {
    const std::string file = path("data.txt");
    preallocateFile(file, 256);
    SparseDataFile data(file);
    data.write(64, "block one");
    data.write(200, "tail");

    EXPECT_EQ(data.read(64, 9), "block one");
    EXPECT_EQ(data.read(200, 4), "tail");
    // Unwritten bytes read as zeros; only the bitmap says what is valid.
    EXPECT_EQ(data.read(0, 4), std::string(4, '\0'));
    EXPECT_EQ(data.size(), 256);
    EXPECT_EQ(data.path(), file);
}

TEST_F(SparseFileTest, ReadPastEndThrows) {
    const std::string file = path("short.txt");
    preallocateFile(file, 10);
    SparseDataFile data(file);
    EXPECT_THROW(data.read(5, 10), CacheIoError);
    EXPECT_EQ(data.read(0, 0), "");
}

TEST_F(SparseFileTest, OpeningMissingFileThrows) {
    EXPECT_THROW(SparseDataFile(path("absent.txt")), CacheIoError);
}

TEST_F(SparseFileTest, AtomicWriteReplacesContent) {
    const std::string file = path("meta.json");
    writeFileAtomic(file, "first");
    writeFileAtomic(file, "second");
    EXPECT_EQ(readWholeFile(file), "second");
    EXPECT_FALSE(std::filesystem::exists(file + ".tmp"));
    EXPECT_THROW(readWholeFile(path("nothing.json")), CacheIoError);
}
