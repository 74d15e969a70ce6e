#pragma once

#include <gmock/gmock.h>

#include <string>
#include <utility>
#include <vector>

#include "scribe_core/ocr/ocr_service.hpp"
#include "scribe_core/types/ocr_result.hpp"

namespace scribe_tests {

/**
 * Mock class for the remote OCR service to use in tests
 */
class MockOcrService : public scribe_core::OcrService {
 public:
  MOCK_METHOD(std::string, stage,
              (const std::string& bytes, const std::string& file_name, const std::string& purpose),
              (override));
  MOCK_METHOD(std::string, locate, (const std::string& handle), (override));
  MOCK_METHOD(scribe_core::OcrResult, process,
              (const scribe_core::DocumentRef& document, bool include_images), (override));
  MOCK_METHOD(void, release, (const std::string& handle), (override));
};

/**
 * Utility functions for creating test data in tests
 */
namespace MockUtilities {

inline scribe_core::Page create_test_page(int index,
                                          const std::string& markdown,
                                          std::vector<scribe_core::PageImage> images = {}) {
  scribe_core::Page page;
  page.index = index;
  page.markdown = markdown;
  page.images = std::move(images);
  return page;
}

// One page per markdown string, indexed from 0
inline scribe_core::OcrResult create_test_result(const std::vector<std::string>& page_texts) {
  scribe_core::OcrResult result;
  result.model = "mistral-ocr-latest";
  for (size_t i = 0; i < page_texts.size(); ++i) {
    result.pages.push_back(create_test_page(static_cast<int>(i), page_texts[i]));
  }
  return result;
}

}  // namespace MockUtilities

}  // namespace scribe_tests
