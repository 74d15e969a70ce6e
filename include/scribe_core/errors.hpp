#pragma once

#include <stdexcept>
#include <string>

namespace scribe_core {

// A local file could not be opened or read
class LocalIoError : public std::exception {
 public:
  explicit LocalIoError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The input directory could not be enumerated. Fatal for a run.
class DirectoryListError : public std::exception {
 public:
  explicit DirectoryListError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace scribe_core
