#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ragdex_core {

using Embedding = std::vector<float>;

// A vector index cannot mix dimensions; raised wherever a vector disagrees
// with the dimension established for the index.
class DimensionMismatchError : public std::exception {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : expected_(expected),
        actual_(actual),
        message_("Vector dimension mismatch. Expected " + std::to_string(expected) + ", got " +
                 std::to_string(actual)) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  size_t expected() const noexcept {
    return expected_;
  }
  size_t actual() const noexcept {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
  std::string message_;
};

}  // namespace ragdex_core
