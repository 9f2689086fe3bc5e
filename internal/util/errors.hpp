#pragma once

#include <stdexcept>
#include <string>

namespace stash::util {

/*
  Central error types.

  None of these cross the engine boundary: the composition root turns
  StorageUnavailable into a memory-backed fallback, and the command
  processor turns TaskNotFound into reply text.
*/

class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TaskNotFound : public std::runtime_error {
 public:
  explicit TaskNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace stash::util
