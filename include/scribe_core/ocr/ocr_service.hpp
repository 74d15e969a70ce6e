#pragma once

#include <stdexcept>
#include <string>

#include "scribe_core/types/ocr_result.hpp"

namespace scribe_core {

// Raised for any failed exchange with the remote OCR service
class OcrServiceError : public std::exception {
 public:
  explicit OcrServiceError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class OcrService
 * @brief Remote OCR capability used by the conversion pipeline.
 *
 * Implementations hold no per-call state that callers need to manage; one
 * instance is shared by every file of a batch. All operations throw
 * OcrServiceError on failure.
 */
class OcrService {
 public:
  virtual ~OcrService() = default;

  /**
   * @brief Uploads a payload to the service's file store.
   * @param bytes Raw file contents.
   * @param file_name Name the payload is stored under.
   * @param purpose Purpose tag, "ocr" for documents awaiting recognition.
   * @return Handle of the staged resource. Must later be passed to release().
   */
  virtual std::string stage(const std::string& bytes,
                            const std::string& file_name,
                            const std::string& purpose) = 0;

  /**
   * @brief Mints a short-lived URL from which the service can fetch a staged resource.
   * @return The URL, or an empty string if the service answered without one.
   */
  virtual std::string locate(const std::string& handle) = 0;

  // Runs OCR on the referenced document
  virtual OcrResult process(const DocumentRef& document, bool include_images) = 0;

  // Deletes a staged resource
  virtual void release(const std::string& handle) = 0;
};

}  // namespace scribe_core
