#include "store/file_sink.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>

namespace peerdrop {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileSink::FileSink(const std::filesystem::path& directory, const std::string& filename)
  : final_path_(directory / filename)
  , part_path_(directory / (filename + ".part")) {
  BOOST_LOG_TRIVIAL(debug) << "FileSink: Preparing " << final_path_.string();

  std::error_code ec;
  if (!directory.empty() && !std::filesystem::exists(directory, ec)) {
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      throw IoError("cannot create directory " + directory.string() + ": " + ec.message());
    }
  }

  // Truncate any leftover partial file from an earlier attempt
  file_.open(part_path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file_) {
    throw IoError("cannot create " + part_path_.string());
  }
  BOOST_LOG_TRIVIAL(info) << "FileSink: Writing to " << part_path_.string();
}

FileSink::~FileSink() {
  if (!finalized_) {
    discard();
  }
}


//==============================================
// WRITE OPERATIONS
//==============================================

void FileSink::write_at(std::uint64_t offset, const uint8_t* data, std::size_t length) {
  if (finalized_ || discarded_) {
    throw IoError("write to closed file " + part_path_.string());
  }

  file_.seekp(static_cast<std::streamoff>(offset));
  file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
  if (!file_) {
    throw IoError("write of " + std::to_string(length) + " bytes at offset " +
                  std::to_string(offset) + " to " + part_path_.string() + " failed");
  }
  bytes_written_ += length;
}

std::filesystem::path FileSink::finalize() {
  if (finalized_) {
    return final_path_;
  }
  if (discarded_) {
    throw IoError("file " + part_path_.string() + " was already discarded");
  }

  file_.flush();
  if (!file_) {
    throw IoError("flush of " + part_path_.string() + " failed");
  }
  file_.close();

  std::error_code ec;
  std::filesystem::rename(part_path_, final_path_, ec);
  if (ec) {
    throw IoError("cannot rename " + part_path_.string() + " to " + final_path_.string() + ": " + ec.message());
  }

  finalized_ = true;
  BOOST_LOG_TRIVIAL(info) << "FileSink: Saved " << final_path_.string() << " (" << bytes_written_ << " bytes)";
  return final_path_;
}

void FileSink::discard() noexcept {
  if (discarded_ || finalized_) {
    return;
  }
  discarded_ = true;
  if (file_.is_open()) {
    file_.close();
  }

  std::error_code ec;
  std::filesystem::remove(part_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "FileSink: Could not remove " << part_path_.string() << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(info) << "FileSink: Discarded partial file " << part_path_.string();
  }
}

} // namespace store
} // namespace peerdrop
