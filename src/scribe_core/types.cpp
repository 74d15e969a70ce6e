#include "scribe_core/types/file.hpp"
#include "scribe_core/types/outcome.hpp"

#include <algorithm>
#include <cctype>

namespace scribe_core {

std::string normalized_extension(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

FileKind file_kind_for(const std::filesystem::path& path) {
  return normalized_extension(path) == ".pdf" ? FileKind::PDF : FileKind::Image;
}

std::string to_string(FileKind kind) {
  switch (kind) {
    case FileKind::PDF:
      return "PDF";
    case FileKind::Image:
      return "Image";
    default:
      return "Unknown";
  }
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MissingCredential:
      return "MissingCredential";
    case ErrorKind::ClientInitError:
      return "ClientInitError";
    case ErrorKind::DirectoryListError:
      return "DirectoryListError";
    case ErrorKind::LocalIoError:
      return "LocalIoError";
    case ErrorKind::RemoteServiceError:
      return "RemoteServiceError";
    case ErrorKind::ReleaseWarning:
      return "ReleaseWarning";
    case ErrorKind::WriteError:
      return "WriteError";
    default:
      return "Unknown";
  }
}

std::string to_string(Outcome outcome) {
  switch (outcome) {
    case Outcome::Processed:
      return "Processed";
    case Outcome::Skipped:
      return "Skipped";
    case Outcome::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

std::string to_string(SkipReason reason) {
  switch (reason) {
    case SkipReason::OutputExists:
      return "output already exists";
    case SkipReason::SelfFile:
      return "file is the running program";
    default:
      return "unknown";
  }
}

}  // namespace scribe_core
