#include "scribe_core/services/batch_orchestrator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include "scribe_core/errors.hpp"

namespace scribe_core {

namespace {

struct FileCloser {
  void operator()(std::FILE* file) const { std::fclose(file); }
};

}  // namespace

BatchOrchestrator::BatchOrchestrator(std::shared_ptr<DocumentPipeline> pipeline,
                                     std::shared_ptr<const MarkdownSynthesizer> synthesizer,
                                     BatchOptions options)
    : pipeline_(std::move(pipeline)),
      synthesizer_(std::move(synthesizer)),
      options_(std::move(options)) {
  if (!pipeline_ || !synthesizer_) {
    throw std::invalid_argument("BatchOrchestrator requires a pipeline and a synthesizer");
  }
  // ".md" is the output format and is never a candidate
  options_.supported_extensions.erase(".md");
}

std::vector<SourceFile> BatchOrchestrator::discover(const std::filesystem::path& directory) const {
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    throw DirectoryListError("Error listing files in directory " + directory.string() + ": " +
                             ec.message());
  }

  std::vector<SourceFile> candidates;
  std::filesystem::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code status_ec;
    if (!it->is_regular_file(status_ec) || status_ec) {
      continue;
    }
    const std::filesystem::path& path = it->path();
    if (options_.supported_extensions.count(normalized_extension(path)) == 0) {
      continue;
    }
    candidates.push_back({path, file_kind_for(path)});
  }
  if (ec) {
    throw DirectoryListError("Error listing files in directory " + directory.string() + ": " +
                             ec.message());
  }

  std::sort(candidates.begin(), candidates.end(), [](const SourceFile& a, const SourceFile& b) {
    return a.path.filename() < b.path.filename();
  });
  return candidates;
}

bool BatchOrchestrator::is_self(const std::filesystem::path& file_path) const {
  if (!options_.self_path) {
    return false;
  }
  std::error_code ec;
  bool same = std::filesystem::equivalent(file_path, *options_.self_path, ec);
  return !ec && same;
}

void BatchOrchestrator::write_new_file(const std::filesystem::path& output_path,
                                       const std::string& content) {
  // "x": fail instead of truncating when the file already exists
  std::unique_ptr<std::FILE, FileCloser> file(std::fopen(output_path.c_str(), "wx"));
  if (!file) {
    throw LocalIoError("Could not create " + output_path.string() + ": " + std::strerror(errno));
  }
  const bool written =
      content.empty() ||
      std::fwrite(content.data(), 1, content.size(), file.get()) == content.size();
  int write_errno = errno;
  const bool closed = std::fclose(file.release()) == 0;
  if (written && closed) {
    return;
  }
  if (written) {
    write_errno = errno;
  }

  // Remove the partial file created above
  std::error_code ec;
  std::filesystem::remove(output_path, ec);
  if (ec) {
    std::cerr << "  Warning: could not remove partial file " << output_path.string() << ": "
              << ec.message() << std::endl;
  }
  throw LocalIoError("Could not write " + output_path.string() + ": " +
                     std::strerror(write_errno));
}

FileReport BatchOrchestrator::convert(const SourceFile& file) {
  FileReport report{file.file_name(), Outcome::Failed, std::nullopt, std::nullopt, ""};
  const std::filesystem::path output_path = file.output_path();

  std::error_code ec;
  if (std::filesystem::exists(output_path, ec)) {
    std::cout << "  Skipping: Output file " << output_path.filename().string()
              << " already exists." << std::endl;
    report.outcome = Outcome::Skipped;
    report.skip_reason = SkipReason::OutputExists;
    return report;
  }
  if (is_self(file.path)) {
    std::cout << "  Skipping: Cannot process the program file itself (" << file.file_name() << ")."
              << std::endl;
    report.outcome = Outcome::Skipped;
    report.skip_reason = SkipReason::SelfFile;
    return report;
  }

  PipelineResult pipeline_result = pipeline_->run(file);
  if (!pipeline_result.success()) {
    std::cerr << "  Skipping Markdown generation due to previous error for " << file.file_name()
              << "." << std::endl;
    report.error_kind = pipeline_result.error_kind;
    report.message = pipeline_result.error_message;
    return report;
  }
  if (pipeline_result.release_warning) {
    report.message = *pipeline_result.release_warning;
  }

  const OcrResult& result = *pipeline_result.result;
  const bool embed = file.kind == FileKind::PDF && options_.embed_images;

  std::cout << "  Generating Markdown content..." << std::endl;
  const std::string markdown = synthesizer_->synthesize(result, embed);
  if (markdown.empty() && !result.pages.empty()) {
    std::cerr << "  Warning: Markdown generation resulted in empty content for "
              << file.file_name() << ", though pages were present." << std::endl;
  } else if (markdown.empty()) {
    std::cerr << "  Warning: Markdown generation resulted in empty content for "
              << file.file_name() << "." << std::endl;
  }

  std::cout << "  Saving Markdown to: " << output_path.filename().string() << std::endl;
  try {
    write_new_file(output_path, markdown);
  } catch (const LocalIoError& e) {
    std::cerr << "  Error writing Markdown file " << output_path.filename().string() << ": "
              << e.what() << std::endl;
    report.error_kind = ErrorKind::WriteError;
    report.message = e.what();
    return report;
  }

  std::cout << "  Successfully saved " << output_path.filename().string() << std::endl;
  report.outcome = Outcome::Processed;
  return report;
}

RunSummary BatchOrchestrator::run_batch(const std::filesystem::path& directory) {
  RunSummary summary;
  std::vector<SourceFile> candidates = discover(directory);

  if (candidates.empty()) {
    std::cout << "No supported files found to process in " << directory.string() << "."
              << std::endl;
    return summary;
  }
  std::cout << "Found " << candidates.size() << " potential files to process." << std::endl;

  summary.candidates = candidates.size();
  for (const auto& file : candidates) {
    std::cout << "\nProcessing file: " << file.file_name() << std::endl;
    FileReport report = convert(file);

    switch (report.outcome) {
      case Outcome::Processed:
        ++summary.processed;
        break;
      case Outcome::Skipped:
        ++summary.skipped;
        break;
      case Outcome::Failed:
        ++summary.errors;
        break;
    }
    summary.files.push_back(std::move(report));
  }
  return summary;
}

}  // namespace scribe_core
