#pragma once

#include <filesystem>
#include <string>

namespace scribe_core {

// Kind of a source document, derived from its extension
enum class FileKind { PDF, Image };

struct SourceFile {
  std::filesystem::path path;
  FileKind kind;

  std::string file_name() const { return path.filename().string(); }

  // The Markdown file this source converts into (same directory, same stem)
  std::filesystem::path output_path() const {
    std::filesystem::path out = path;
    out.replace_extension(".md");
    return out;
  }
};

// Lower-cased extension including the leading dot, e.g. ".pdf"
std::string normalized_extension(const std::filesystem::path& path);

// Anything that is not a PDF is sent to the service as an inline image
FileKind file_kind_for(const std::filesystem::path& path);

std::string to_string(FileKind kind);

}  // namespace scribe_core
