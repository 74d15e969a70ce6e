#pragma once

#include <string>

#include "scribe_core/types/ocr_result.hpp"

namespace scribe_core {

/**
 * @class MarkdownSynthesizer
 * @brief Assembles the pages of an OcrResult into one Markdown document.
 *
 * Pages are emitted in index order and joined with kPageSeparator. When
 * images are embedded, every literal "![id](id)" placeholder is rewritten to
 * point at an inline PNG data URL built from the image's base64 payload.
 */
class MarkdownSynthesizer {
 public:
  static constexpr const char* kPageSeparator = "\n\n---\n\n";
  static constexpr const char* kImageDataPrefix = "data:image/png;base64,";

  virtual ~MarkdownSynthesizer() = default;

  virtual std::string synthesize(const OcrResult& result, bool embed_images) const;

  // Replaces every "![id](id)" in markdown with "![id](replacement)". Exact
  // string matching, no pattern syntax. Returns the number of replacements.
  static size_t replace_placeholder(std::string& markdown,
                                    const std::string& id,
                                    const std::string& replacement);

 private:
  std::string render_page(const Page& page, bool embed_images) const;
};

}  // namespace scribe_core
