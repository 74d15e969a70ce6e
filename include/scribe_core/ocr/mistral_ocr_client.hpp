#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "scribe_core/ocr/ocr_service.hpp"

namespace scribe_core {

// Raised when the client cannot be constructed
class OcrClientError : public std::exception {
 public:
  explicit OcrClientError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct MistralClientOptions {
  std::string api_base_url = "https://api.mistral.ai";
  std::string api_key;
  std::string model = "mistral-ocr-latest";
  long request_timeout_seconds = 0;  // 0 waits indefinitely
  int signed_url_expiry_hours = 24;
};

/**
 * @class MistralOcrClient
 * @brief OcrService backed by the Mistral files and OCR REST endpoints.
 *
 * Owns one libcurl easy handle which is reset before every request. The
 * configured model identifier is sent with every OCR call.
 */
class MistralOcrClient : public OcrService {
 public:
  explicit MistralOcrClient(MistralClientOptions options);
  ~MistralOcrClient() override;

  // Disable copy constructor and assignment
  MistralOcrClient(const MistralOcrClient&) = delete;
  MistralOcrClient& operator=(const MistralOcrClient&) = delete;

  std::string stage(const std::string& bytes,
                    const std::string& file_name,
                    const std::string& purpose) override;
  std::string locate(const std::string& handle) override;
  OcrResult process(const DocumentRef& document, bool include_images) override;
  void release(const std::string& handle) override;

  // Body of a POST /v1/ocr request
  static nlohmann::json build_ocr_request(const std::string& model,
                                          const DocumentRef& document,
                                          bool include_images);

 private:
  struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
  };
  using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

  MistralClientOptions options_;
  CURL* curl_handle_;

  // HTTP methods
  nlohmann::json make_get_request(const std::string& endpoint);
  nlohmann::json make_post_request(const std::string& endpoint, const nlohmann::json& data);
  nlohmann::json make_delete_request(const std::string& endpoint);
  nlohmann::json make_upload_request(const std::string& endpoint,
                                     const std::string& bytes,
                                     const std::string& file_name,
                                     const std::string& purpose);

  // Helper methods
  void prepare_request(const std::string& endpoint, std::string& response_buffer);
  HeaderList auth_headers(bool json_body) const;
  nlohmann::json perform(const std::string& endpoint, const std::string& response_buffer);
  std::string escape(const std::string& value) const;
  std::string build_url(const std::string& endpoint) const;
  static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
};

}  // namespace scribe_core
