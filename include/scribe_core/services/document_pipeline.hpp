#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "scribe_core/ocr/ocr_service.hpp"
#include "scribe_core/types/file.hpp"
#include "scribe_core/types/ocr_result.hpp"
#include "scribe_core/types/outcome.hpp"
#include "scribe_core/utils/mime_types.hpp"

namespace scribe_core {

struct PipelineResult {
  std::optional<OcrResult> result;
  std::optional<ErrorKind> error_kind;
  std::string error_message;
  std::optional<std::string> release_warning;

  bool success() const { return result.has_value(); }

  static PipelineResult success_response(OcrResult result,
                                         std::optional<std::string> release_warning = std::nullopt) {
    return {std::move(result), std::nullopt, "", std::move(release_warning)};
  }

  static PipelineResult failure_response(ErrorKind kind,
                                         const std::string& message,
                                         std::optional<std::string> release_warning = std::nullopt) {
    return {std::nullopt, kind, message, std::move(release_warning)};
  }
};

struct PipelineOptions {
  // Ask the service to return page images for PDFs
  bool embed_images = false;
  std::string upload_purpose = "ocr";
};

/**
 * @class DocumentPipeline
 * @brief Converts one source file into an OcrResult through the remote service.
 *
 * PDFs are uploaded, located by a signed URL, processed and then deleted
 * again; the delete happens on every path once the upload succeeded. Images
 * are sent inline as base64 data URLs and leave nothing behind remotely.
 * Failures are returned as a typed PipelineResult, never thrown.
 */
class DocumentPipeline {
 public:
  DocumentPipeline(std::shared_ptr<OcrService> ocr_service,
                   PipelineOptions options,
                   std::shared_ptr<const MimeTypeResolver> mime_resolver =
                       std::make_shared<MimeTypeResolver>());

  virtual ~DocumentPipeline() = default;

  virtual PipelineResult run(const SourceFile& file);

  // "data:<mime>;base64,<payload>"
  static std::string make_data_url(const std::string& mime_type, const std::string& bytes);

  const PipelineOptions& options() const { return options_; }

 protected:
  /**
   * @brief Reads the whole file.
   * @throw LocalIoError if the file cannot be opened or fewer bytes than its
   *        size could be read.
   */
  virtual std::string read_file_bytes(const std::filesystem::path& file_path) const;

 private:
  PipelineResult run_pdf(const SourceFile& file);
  PipelineResult run_image(const SourceFile& file);

  std::shared_ptr<OcrService> ocr_service_;
  PipelineOptions options_;
  std::shared_ptr<const MimeTypeResolver> mime_resolver_;
};

}  // namespace scribe_core
