#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include "store/store_error.hpp"

namespace peerdrop {
namespace store {

// Write side of a transfer. Bytes go to "<name>.part" inside the output
// directory; finalize() renames it to "<name>", discard() removes it.
// A sink destroyed without finalize() discards.
class FileSink {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the directory if needed; throws IoError
  FileSink(const std::filesystem::path& directory, const std::string& filename);
  ~FileSink();

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;


  // ---- WRITE OPERATIONS ----
  // Random access, so chunks may land in any order
  void write_at(std::uint64_t offset, const uint8_t* data, std::size_t length);
  // Flushes, closes and renames the partial file. Returns the final path.
  std::filesystem::path finalize();
  // Closes and removes the partial file; never throws
  void discard() noexcept;


  // ---- QUERY OPERATIONS ----
  const std::filesystem::path& final_path() const { return final_path_; }
  const std::filesystem::path& part_path() const { return part_path_; }
  std::uint64_t bytes_written() const { return bytes_written_; }
  bool finalized() const { return finalized_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path final_path_;
  std::filesystem::path part_path_;
  std::fstream file_;
  std::uint64_t bytes_written_ = 0;
  bool finalized_ = false;
  bool discarded_ = false;
};

} // namespace store
} // namespace peerdrop
