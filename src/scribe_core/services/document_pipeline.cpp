#include "scribe_core/services/document_pipeline.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <new>
#include <stdexcept>
#include <system_error>

#include "scribe_core/errors.hpp"
#include "scribe_core/services/staged_resource_guard.hpp"
#include "scribe_core/utils/base64.hpp"

namespace scribe_core {

DocumentPipeline::DocumentPipeline(std::shared_ptr<OcrService> ocr_service,
                                   PipelineOptions options,
                                   std::shared_ptr<const MimeTypeResolver> mime_resolver)
    : ocr_service_(std::move(ocr_service)),
      options_(std::move(options)),
      mime_resolver_(std::move(mime_resolver)) {
  if (!ocr_service_) {
    throw std::invalid_argument("DocumentPipeline requires an OCR service");
  }
  if (!mime_resolver_) {
    throw std::invalid_argument("DocumentPipeline requires a MIME type resolver");
  }
}

PipelineResult DocumentPipeline::run(const SourceFile& file) {
  switch (file.kind) {
    case FileKind::PDF:
      return run_pdf(file);
    case FileKind::Image:
      return run_image(file);
    default:
      return PipelineResult::failure_response(ErrorKind::LocalIoError,
                                              "Unsupported file kind for " + file.file_name());
  }
}

std::string DocumentPipeline::read_file_bytes(const std::filesystem::path& file_path) const {
  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw LocalIoError("Could not determine size of " + file_path.string() + ": " + ec.message());
  }

  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw LocalIoError("Could not open file: " + file_path.string());
  }

  std::string bytes(static_cast<size_t>(size), '\0');
  if (size > 0) {
    file_stream.read(&bytes[0], static_cast<std::streamsize>(bytes.size()));
    if (static_cast<std::uintmax_t>(file_stream.gcount()) != size) {
      throw LocalIoError("Could not read file: " + file_path.string() + " (read " +
                         std::to_string(file_stream.gcount()) + " of " + std::to_string(size) +
                         " bytes)");
    }
  }
  return bytes;
}

std::string DocumentPipeline::make_data_url(const std::string& mime_type, const std::string& bytes) {
  return "data:" + mime_type + ";base64," + base64_encode(bytes);
}

PipelineResult DocumentPipeline::run_pdf(const SourceFile& file) {
  std::cout << "  Processing PDF: " << file.file_name() << "..." << std::endl;

  // 1. Read the document
  std::string bytes;
  try {
    bytes = read_file_bytes(file.path);
  } catch (const LocalIoError& e) {
    std::cerr << "  File error accessing PDF " << file.file_name() << ": " << e.what() << std::endl;
    return PipelineResult::failure_response(ErrorKind::LocalIoError, e.what());
  } catch (const std::bad_alloc&) {
    std::cerr << "  Not enough memory to read PDF " << file.file_name() << std::endl;
    return PipelineResult::failure_response(ErrorKind::LocalIoError,
                                            "Not enough memory to read " + file.file_name());
  } catch (const std::length_error& e) {
    std::cerr << "  PDF " << file.file_name() << " is too large: " << e.what() << std::endl;
    return PipelineResult::failure_response(ErrorKind::LocalIoError,
                                            file.file_name() + " is too large to read");
  }

  // 2. Upload it. Nothing to clean up if this fails.
  std::string handle;
  try {
    std::cout << "    Uploading file..." << std::endl;
    handle = ocr_service_->stage(bytes, file.file_name(), options_.upload_purpose);
  } catch (const OcrServiceError& e) {
    std::cerr << "  Error uploading " << file.file_name() << ": " << e.what() << std::endl;
    return PipelineResult::failure_response(ErrorKind::RemoteServiceError, e.what());
  }
  std::cout << "    File uploaded successfully. File ID: " << handle << std::endl;

  // From here on the upload is deleted on every exit path
  StagedResourceGuard staged(*ocr_service_, handle);

  std::optional<OcrResult> result;
  std::string error_message;
  try {
    // 3. Signed URL
    std::cout << "    Getting signed URL..." << std::endl;
    const std::string locator = ocr_service_->locate(staged.handle());
    if (locator.empty()) {
      throw OcrServiceError("Service returned no usable signed URL for file " + handle);
    }
    std::cout << "    Signed URL obtained." << std::endl;

    // 4. OCR
    std::cout << "    Sending to OCR service..." << std::endl;
    result = ocr_service_->process(DocumentRef::document_locator(locator), options_.embed_images);
    std::cout << "    OCR processing complete." << std::endl;
  } catch (const OcrServiceError& e) {
    error_message = e.what();
    std::cerr << "  Error during PDF processing for " << file.file_name() << ": " << error_message
              << std::endl;
  }

  // 5. Delete the upload before the outcome is decided
  staged.release();

  if (!result) {
    return PipelineResult::failure_response(ErrorKind::RemoteServiceError, error_message,
                                            staged.release_warning());
  }
  return PipelineResult::success_response(std::move(*result), staged.release_warning());
}

PipelineResult DocumentPipeline::run_image(const SourceFile& file) {
  std::cout << "  Processing Image: " << file.file_name() << "..." << std::endl;

  // 1. Read and encode
  std::string data_url;
  try {
    std::string bytes = read_file_bytes(file.path);
    if (bytes.empty()) {
      throw LocalIoError("Read 0 bytes from image file " + file.file_name());
    }
    std::cout << "    Read " << bytes.size() << " bytes from " << file.file_name() << std::endl;

    // 2. MIME type and data URL
    const std::string mime_type = mime_resolver_->resolve(file.path);
    data_url = make_data_url(mime_type, bytes);
    std::cout << "    Sending data URL prefix: data:" << mime_type
              << ";base64,... (length: " << data_url.size() << ")" << std::endl;
  } catch (const LocalIoError& e) {
    std::cerr << "  File error reading image " << file.file_name() << ": " << e.what() << std::endl;
    return PipelineResult::failure_response(ErrorKind::LocalIoError, e.what());
  } catch (const std::runtime_error& e) {
    std::cerr << "  Could not encode image " << file.file_name() << ": " << e.what() << std::endl;
    return PipelineResult::failure_response(ErrorKind::LocalIoError, e.what());
  } catch (const std::bad_alloc&) {
    std::cerr << "  Not enough memory to encode image " << file.file_name() << std::endl;
    return PipelineResult::failure_response(ErrorKind::LocalIoError,
                                            "Not enough memory to encode " + file.file_name());
  } catch (const std::length_error& e) {
    std::cerr << "  Image " << file.file_name() << " is too large: " << e.what() << std::endl;
    return PipelineResult::failure_response(ErrorKind::LocalIoError,
                                            file.file_name() + " is too large to encode");
  }

  // 3. OCR on the inline payload
  try {
    std::cout << "    Sending to OCR service..." << std::endl;
    OcrResult result = ocr_service_->process(DocumentRef::inline_data(data_url), false);
    std::cout << "    OCR processing complete." << std::endl;
    return PipelineResult::success_response(std::move(result));
  } catch (const OcrServiceError& e) {
    std::cerr << "  Error during image processing for " << file.file_name() << ": " << e.what()
              << std::endl;
    return PipelineResult::failure_response(ErrorKind::RemoteServiceError, e.what());
  }
}

}  // namespace scribe_core
