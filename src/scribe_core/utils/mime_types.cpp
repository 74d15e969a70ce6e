#include "scribe_core/utils/mime_types.hpp"

#include <fstream>
#include <sstream>

#include "scribe_core/types/file.hpp"

namespace scribe_core {

MimeTypeResolver::MimeTypeResolver() : MimeTypeResolver(system_database_files()) {}

MimeTypeResolver::MimeTypeResolver(const std::vector<std::filesystem::path>& database_files) {
  for (const auto& database_file : database_files) {
    load_database(database_file);
  }
}

std::vector<std::filesystem::path> MimeTypeResolver::system_database_files() {
  return {"/etc/mime.types",
          "/etc/httpd/mime.types",
          "/etc/apache2/mime.types",
          "/usr/local/etc/mime.types"};
}

// Format: "type/subtype ext1 ext2 ...", '#' starts a comment. Later files win.
void MimeTypeResolver::load_database(const std::filesystem::path& database_file) {
  std::ifstream stream(database_file);
  if (!stream.is_open()) {
    return;
  }

  std::string line;
  while (std::getline(stream, line)) {
    const auto comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }

    std::istringstream fields(line);
    std::string mime_type;
    if (!(fields >> mime_type) || mime_type.find('/') == std::string::npos) {
      continue;
    }

    std::string extension;
    while (fields >> extension) {
      // Tokens such as "a/b" have no usable extension
      const std::string normalized = normalized_extension("x." + extension);
      if (normalized.size() < 2) {
        continue;
      }
      extension_to_type_[normalized.substr(1)] = mime_type;
    }
  }
}

std::optional<std::string> MimeTypeResolver::infer(const std::filesystem::path& file_path) const {
  const std::string ext = normalized_extension(file_path);
  if (ext.size() < 2) {
    return std::nullopt;
  }
  auto it = extension_to_type_.find(ext.substr(1));
  if (it == extension_to_type_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> MimeTypeResolver::from_extension_table(
    const std::filesystem::path& file_path) {
  static const std::unordered_map<std::string, std::string> table = {
      {".png", "image/png"},
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".webp", "image/webp"},
  };
  auto it = table.find(normalized_extension(file_path));
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string MimeTypeResolver::resolve(const std::filesystem::path& file_path) const {
  if (auto inferred = infer(file_path)) {
    return *inferred;
  }
  if (auto from_table = from_extension_table(file_path)) {
    return *from_table;
  }
  return kDefaultMimeType;
}

}  // namespace scribe_core
