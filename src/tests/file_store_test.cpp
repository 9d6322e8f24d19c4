#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "store/file_sink.hpp"
#include "store/file_source.hpp"
#include "test_utils.hpp"

using namespace peerdrop::store;
using peerdrop::test::TempDir;
using peerdrop::test::random_bytes;
using peerdrop::test::read_file;

class FileStoreTest : public ::testing::Test {
protected:
  TempDir dir;

  std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
  }
};

//==============================================
// FILE SOURCE
//==============================================

TEST_F(FileStoreTest, SourceReadsFrontToBack) {
  const auto content = random_bytes(1000);
  FileSource source(dir.write_file("data.bin", content));

  EXPECT_EQ(source.size(), 1000u);
  EXPECT_EQ(source.filename(), "data.bin");

  std::vector<uint8_t> collected;
  for (auto slice = source.read_next(300); !slice.empty(); slice = source.read_next(300)) {
    EXPECT_LE(slice.size(), 300u);
    collected.insert(collected.end(), slice.begin(), slice.end());
  }
  EXPECT_EQ(collected, content);
  EXPECT_EQ(source.position(), 1000u);
  EXPECT_TRUE(source.read_next(300).empty());
}

TEST_F(FileStoreTest, SourceLastSliceHoldsRemainder) {
  FileSource source(dir.write_file("hello.txt", "HelloWorld"));
  EXPECT_EQ(source.read_next(4), bytes("Hell"));
  EXPECT_EQ(source.read_next(4), bytes("oWor"));
  EXPECT_EQ(source.read_next(4), bytes("ld"));
}

TEST_F(FileStoreTest, SourceRejectsMissingFile) {
  EXPECT_THROW(FileSource(dir.path() / "absent.txt"), IoError);
}

TEST_F(FileStoreTest, SourceRejectsDirectory) {
  EXPECT_THROW(FileSource(dir.path()), IoError);
}

TEST_F(FileStoreTest, SourceOfEmptyFile) {
  FileSource source(dir.write_file("empty.txt", ""));
  EXPECT_EQ(source.size(), 0u);
  EXPECT_TRUE(source.read_next(16).empty());
}

//==============================================
// FILE SINK
//==============================================

TEST_F(FileStoreTest, SinkWritesOutOfOrderAndFinalizes) {
  std::filesystem::path final_path;
  {
    FileSink sink(dir.path(), "out.txt");
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "out.txt.part"));

    const auto tail = bytes("World");
    const auto head = bytes("Hello");
    sink.write_at(5, tail.data(), tail.size());
    sink.write_at(0, head.data(), head.size());
    EXPECT_EQ(sink.bytes_written(), 10u);

    final_path = sink.finalize();
    EXPECT_TRUE(sink.finalized());
  }

  EXPECT_EQ(final_path, dir.path() / "out.txt");
  EXPECT_EQ(read_file(final_path), bytes("HelloWorld"));
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "out.txt.part"));
}

TEST_F(FileStoreTest, SinkDestroyedWithoutFinalizeDiscards) {
  {
    FileSink sink(dir.path(), "partial.bin");
    const auto data = random_bytes(64);
    sink.write_at(0, data.data(), data.size());
  }
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "partial.bin"));
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "partial.bin.part"));
}

TEST_F(FileStoreTest, SinkRejectsWritesAfterDiscard) {
  FileSink sink(dir.path(), "gone.bin");
  sink.discard();
  const auto data = bytes("x");
  EXPECT_THROW(sink.write_at(0, data.data(), data.size()), IoError);
  EXPECT_THROW(sink.finalize(), IoError);
}

TEST_F(FileStoreTest, SinkOverwritesExistingFile) {
  dir.write_file("report.txt", "an older and much longer report");
  FileSink sink(dir.path(), "report.txt");
  const auto data = bytes("new");
  sink.write_at(0, data.data(), data.size());
  EXPECT_EQ(read_file(sink.finalize()), data);
}

TEST_F(FileStoreTest, SinkCreatesOutputDirectory) {
  const auto nested = dir.path() / "a" / "b";
  FileSink sink(nested, "file.txt");
  EXPECT_TRUE(std::filesystem::is_directory(nested));
  EXPECT_EQ(sink.finalize(), nested / "file.txt");
  EXPECT_TRUE(std::filesystem::exists(nested / "file.txt"));
}
