#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "store/store_error.hpp"

namespace peerdrop {
namespace store {

// Read side of a transfer: one regular file read front to back
class FileSource {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws IoError when the path is missing, not a regular file or unreadable
  explicit FileSource(const std::filesystem::path& path);


  // ---- READ OPERATIONS ----
  // Next slice of at most max_length bytes, empty at end of file
  std::vector<uint8_t> read_next(std::size_t max_length);


  // ---- QUERY OPERATIONS ----
  std::uint64_t size() const { return size_; }
  std::uint64_t position() const { return position_; }
  // Final path component, the name announced to the receiver
  std::string filename() const { return path_.filename().string(); }
  const std::filesystem::path& path() const { return path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::ifstream file_;
  std::uint64_t size_ = 0;
  std::uint64_t position_ = 0;
};

} // namespace store
} // namespace peerdrop
