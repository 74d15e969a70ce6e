#include "scribe_core/services/markdown_synthesizer.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace scribe_core {

std::string MarkdownSynthesizer::synthesize(const OcrResult& result, bool embed_images) const {
  if (result.pages.empty()) {
    return "";
  }

  std::vector<const Page*> ordered;
  ordered.reserve(result.pages.size());
  for (const auto& page : result.pages) {
    ordered.push_back(&page);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const Page* a, const Page* b) { return a->index < b->index; });

  std::string markdown;
  for (size_t i = 0; i < ordered.size(); ++i) {
    if (i > 0) {
      markdown += kPageSeparator;
    }
    markdown += render_page(*ordered[i], embed_images);
  }
  return markdown;
}

std::string MarkdownSynthesizer::render_page(const Page& page, bool embed_images) const {
  std::string markdown = page.markdown;
  if (!embed_images || page.images.empty()) {
    return markdown;
  }

  for (const auto& image : page.images) {
    if (image.id.empty() || image.image_base64.empty()) {
      std::cerr << "[MarkdownSynthesizer] Warning: image on page index " << page.index
                << " is missing its id or payload, leaving it unsubstituted." << std::endl;
      continue;
    }
    replace_placeholder(markdown, image.id, kImageDataPrefix + image.image_base64);
  }
  return markdown;
}

size_t MarkdownSynthesizer::replace_placeholder(std::string& markdown,
                                                const std::string& id,
                                                const std::string& replacement) {
  const std::string placeholder = "![" + id + "](" + id + ")";
  const std::string substituted = "![" + id + "](" + replacement + ")";

  size_t count = 0;
  size_t pos = 0;
  while ((pos = markdown.find(placeholder, pos)) != std::string::npos) {
    markdown.replace(pos, placeholder.size(), substituted);
    pos += substituted.size();
    ++count;
  }
  return count;
}

}  // namespace scribe_core
