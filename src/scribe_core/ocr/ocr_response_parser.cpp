#include "scribe_core/ocr/ocr_response_parser.hpp"

#include "scribe_core/ocr/ocr_service.hpp"

namespace scribe_core {

using json = nlohmann::json;

std::string OcrResponseParser::optional_string(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    throw OcrServiceError(std::string("Field '") + key + "' is not a string");
  }
  return it->get<std::string>();
}

OcrResult OcrResponseParser::parse_ocr_result(const json& body) {
  if (!body.is_object()) {
    throw OcrServiceError("OCR response is not a JSON object");
  }

  OcrResult result;
  result.model = optional_string(body, "model");

  auto pages = body.find("pages");
  if (pages == body.end() || pages->is_null()) {
    return result;
  }
  if (!pages->is_array()) {
    throw OcrServiceError("OCR response field 'pages' is not an array");
  }

  result.pages.reserve(pages->size());
  for (size_t i = 0; i < pages->size(); ++i) {
    result.pages.push_back(parse_page((*pages)[i], i));
  }
  return result;
}

Page OcrResponseParser::parse_page(const json& page, size_t position) {
  const std::string page_label = "Page " + std::to_string(position + 1);
  if (!page.is_object()) {
    throw OcrServiceError(page_label + " is not a JSON object");
  }

  auto markdown = page.find("markdown");
  if (markdown == page.end() || !markdown->is_string()) {
    throw OcrServiceError(page_label + " is missing its 'markdown' text");
  }

  Page parsed;
  parsed.markdown = markdown->get<std::string>();

  auto index = page.find("index");
  if (index != page.end() && index->is_number_integer()) {
    parsed.index = index->get<int>();
  } else {
    parsed.index = static_cast<int>(position);
  }

  auto images = page.find("images");
  if (images == page.end() || images->is_null()) {
    return parsed;
  }
  if (!images->is_array()) {
    throw OcrServiceError(page_label + " field 'images' is not an array");
  }
  for (const auto& image : *images) {
    parsed.images.push_back(parse_image(image, position));
  }
  return parsed;
}

PageImage OcrResponseParser::parse_image(const json& image, size_t page_position) {
  if (!image.is_object()) {
    throw OcrServiceError("Image on page " + std::to_string(page_position + 1) +
                          " is not a JSON object");
  }
  PageImage parsed;
  parsed.id = optional_string(image, "id");
  parsed.image_base64 = optional_string(image, "image_base64");
  return parsed;
}

std::string OcrResponseParser::parse_file_id(const json& body) {
  if (!body.is_object()) {
    throw OcrServiceError("Upload response is not a JSON object");
  }
  std::string id = optional_string(body, "id");
  if (id.empty()) {
    throw OcrServiceError("Upload response does not contain a file id");
  }
  return id;
}

std::string OcrResponseParser::parse_signed_url(const json& body) {
  if (!body.is_object()) {
    throw OcrServiceError("Signed URL response is not a JSON object");
  }
  std::string url = optional_string(body, "url");
  if (url.empty()) {
    url = optional_string(body, "signed_url");
  }
  return url;
}

}  // namespace scribe_core
