#pragma once

#include <string>
#include <vector>

namespace scribe_core {

// An image the OCR service extracted from a page. Either field may be empty
// when the service omitted it.
struct PageImage {
  std::string id;
  std::string image_base64;
};

struct Page {
  int index;
  std::string markdown;
  std::vector<PageImage> images;
};

struct OcrResult {
  std::vector<Page> pages;
  std::string model;
};

// What the OCR service is asked to read
struct DocumentRef {
  enum class Type { DocumentLocator, InlineData };

  Type type;
  std::string value;

  static DocumentRef document_locator(const std::string& url) {
    return {Type::DocumentLocator, url};
  }

  static DocumentRef inline_data(const std::string& data_url) {
    return {Type::InlineData, data_url};
  }
};

}  // namespace scribe_core
