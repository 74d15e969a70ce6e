#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scribe_core {

enum class ErrorKind {
  MissingCredential,
  ClientInitError,
  DirectoryListError,
  LocalIoError,
  RemoteServiceError,
  ReleaseWarning,
  WriteError
};

enum class Outcome { Processed, Skipped, Failed };

enum class SkipReason { OutputExists, SelfFile };

std::string to_string(ErrorKind kind);
std::string to_string(Outcome outcome);
std::string to_string(SkipReason reason);

// Result of converting one candidate file
struct FileReport {
  std::string file_name;
  Outcome outcome;
  std::optional<SkipReason> skip_reason;
  std::optional<ErrorKind> error_kind;
  std::string message;
};

struct RunSummary {
  size_t candidates = 0;
  size_t processed = 0;
  size_t skipped = 0;
  size_t errors = 0;
  std::vector<FileReport> files;

  bool has_errors() const { return errors > 0; }
};

}  // namespace scribe_core
