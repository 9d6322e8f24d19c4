#include "store/file_source.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>

namespace peerdrop {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileSource::FileSource(const std::filesystem::path& path) : path_(path) {
  BOOST_LOG_TRIVIAL(debug) << "FileSource: Opening " << path_.string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    throw IoError("not a regular file: " + path_.string() + (ec ? " (" + ec.message() + ")" : ""));
  }

  size_ = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw IoError("cannot stat " + path_.string() + ": " + ec.message());
  }

  // Open in binary mode so sizes match bytes on every platform
  file_.open(path_, std::ios::binary);
  if (!file_) {
    throw IoError("cannot open " + path_.string() + " for reading");
  }

  BOOST_LOG_TRIVIAL(info) << "FileSource: " << filename() << " (" << size_ << " bytes)";
}


//==============================================
// READ OPERATIONS
//==============================================

std::vector<uint8_t> FileSource::read_next(std::size_t max_length) {
  std::vector<uint8_t> buffer;
  if (position_ >= size_ || max_length == 0) {
    return buffer;
  }

  const std::uint64_t remaining = size_ - position_;
  const std::size_t length = remaining < max_length ? static_cast<std::size_t>(remaining) : max_length;
  buffer.resize(length);

  file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
  if (static_cast<std::size_t>(file_.gcount()) != length) {
    throw IoError("short read from " + path_.string() + " at offset " + std::to_string(position_));
  }

  position_ += length;
  BOOST_LOG_TRIVIAL(trace) << "FileSource: Read " << length << " bytes, at " << position_ << "/" << size_;
  return buffer;
}

} // namespace store
} // namespace peerdrop
