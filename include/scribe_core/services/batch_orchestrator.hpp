#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "scribe_core/services/document_pipeline.hpp"
#include "scribe_core/services/markdown_synthesizer.hpp"
#include "scribe_core/types/file.hpp"
#include "scribe_core/types/outcome.hpp"

namespace scribe_core {

struct BatchOptions {
  // Lower-cased, with the leading dot
  std::set<std::string> supported_extensions = {".pdf", ".png", ".jpg", ".jpeg", ".webp"};
  bool embed_images = false;
  // The running program; never sent for conversion
  std::optional<std::filesystem::path> self_path;
};

/**
 * @class BatchOrchestrator
 * @brief Converts every supported file of a directory into a sibling .md file.
 *
 * Files are handled one at a time in file-name order. A file whose .md
 * already exists is skipped without contacting the service, so repeated runs
 * over the same directory only convert what is new. Per-file failures are
 * counted and the batch continues.
 */
class BatchOrchestrator {
 public:
  BatchOrchestrator(std::shared_ptr<DocumentPipeline> pipeline,
                    std::shared_ptr<const MarkdownSynthesizer> synthesizer,
                    BatchOptions options);

  /**
   * @brief Runs the batch over a directory.
   * @throw DirectoryListError if the directory cannot be enumerated.
   */
  RunSummary run_batch(const std::filesystem::path& directory);

  /**
   * @brief Lists the conversion candidates of a directory.
   *
   * Keeps regular files with a supported extension, never ".md", sorted by
   * file name.
   * @throw DirectoryListError if the directory cannot be enumerated.
   */
  std::vector<SourceFile> discover(const std::filesystem::path& directory) const;

 private:
  FileReport convert(const SourceFile& file);
  bool is_self(const std::filesystem::path& file_path) const;

  // Creates output_path and writes content; fails if the file already exists
  static void write_new_file(const std::filesystem::path& output_path, const std::string& content);

  std::shared_ptr<DocumentPipeline> pipeline_;
  std::shared_ptr<const MarkdownSynthesizer> synthesizer_;
  BatchOptions options_;
};

}  // namespace scribe_core
