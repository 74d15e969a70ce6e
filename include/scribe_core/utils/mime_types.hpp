#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scribe_core {

/**
 * @class MimeTypeResolver
 * @brief Maps image file names to MIME types for inline data locators.
 *
 * Lookup order: the system MIME database (mime.types files), then a fixed
 * table of the image formats the service accepts, then "image/jpeg".
 */
class MimeTypeResolver {
 public:
  static constexpr const char* kDefaultMimeType = "image/jpeg";

  // Loads the platform's mime.types files
  MimeTypeResolver();

  // Loads the given mime.types files; missing files are ignored
  explicit MimeTypeResolver(const std::vector<std::filesystem::path>& database_files);

  // MIME type from the system database only
  std::optional<std::string> infer(const std::filesystem::path& file_path) const;

  // MIME type from the fixed extension table only
  static std::optional<std::string> from_extension_table(const std::filesystem::path& file_path);

  std::string resolve(const std::filesystem::path& file_path) const;

  size_t database_size() const { return extension_to_type_.size(); }

  static std::vector<std::filesystem::path> system_database_files();

 private:
  void load_database(const std::filesystem::path& database_file);

  // Keys are lower-cased extensions without the dot
  std::unordered_map<std::string, std::string> extension_to_type_;
};

}  // namespace scribe_core
