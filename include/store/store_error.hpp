#pragma once

#include <stdexcept>
#include <string>

namespace peerdrop {
namespace store {

// Open, read, write or rename failure, with the underlying cause
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& message) : std::runtime_error("I/O error: " + message) {}
};

} // namespace store
} // namespace peerdrop
