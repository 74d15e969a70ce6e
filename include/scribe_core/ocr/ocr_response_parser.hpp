#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "scribe_core/types/ocr_result.hpp"

namespace scribe_core {

/**
 * @class OcrResponseParser
 * @brief Validates the JSON bodies returned by the OCR service.
 *
 * Optional parts of a response ("pages", a page's "images", an image's "id"
 * or "image_base64") may be missing or null and decode as empty. Anything
 * required that is missing or has the wrong type throws OcrServiceError.
 */
class OcrResponseParser {
 public:
  static OcrResult parse_ocr_result(const nlohmann::json& body);

  // Extracts "id" from a file upload response
  static std::string parse_file_id(const nlohmann::json& body);

  // Extracts the locator from a signed URL response; empty when none is present
  static std::string parse_signed_url(const nlohmann::json& body);

 private:
  static Page parse_page(const nlohmann::json& page, size_t position);
  static PageImage parse_image(const nlohmann::json& image, size_t page_position);
  static std::string optional_string(const nlohmann::json& object, const char* key);
};

}  // namespace scribe_core
