#include "scribe_core/ocr/mistral_ocr_client.hpp"

#include <utility>

#include "scribe_core/ocr/ocr_response_parser.hpp"

namespace scribe_core {

namespace {
constexpr size_t kMaxErrorBodyChars = 300;
}

MistralOcrClient::MistralOcrClient(MistralClientOptions options)
    : options_(std::move(options)), curl_handle_(nullptr) {
  if (options_.api_key.empty()) {
    throw OcrClientError("API key is empty");
  }
  if (options_.api_base_url.empty()) {
    throw OcrClientError("API base URL is empty");
  }
  if (options_.model.empty()) {
    throw OcrClientError("OCR model identifier is empty");
  }
  while (!options_.api_base_url.empty() && options_.api_base_url.back() == '/') {
    options_.api_base_url.pop_back();
  }

  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw OcrClientError("Failed to initialize CURL");
  }
}

MistralOcrClient::~MistralOcrClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

size_t MistralOcrClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  userp->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

std::string MistralOcrClient::build_url(const std::string& endpoint) const {
  return options_.api_base_url + endpoint;
}

std::string MistralOcrClient::escape(const std::string& value) const {
  char* escaped = curl_easy_escape(curl_handle_, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw OcrServiceError("Failed to URL-encode '" + value + "'");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

MistralOcrClient::HeaderList MistralOcrClient::auth_headers(bool json_body) const {
  HeaderList headers;
  auto append = [&headers](const std::string& header) {
    curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
    if (!appended) {
      throw OcrServiceError("Failed to build request headers");
    }
    headers.release();
    headers.reset(appended);
  };

  append("Authorization: Bearer " + options_.api_key);
  append("Accept: application/json");
  if (json_body) {
    append("Content-Type: application/json");
  }
  return headers;
}

void MistralOcrClient::prepare_request(const std::string& endpoint, std::string& response_buffer) {
  const std::string url = build_url(endpoint);

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl_handle_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, options_.request_timeout_seconds);
}

nlohmann::json MistralOcrClient::perform(const std::string& endpoint,
                                         const std::string& response_buffer) {
  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw OcrServiceError("Request to " + endpoint + " failed: " +
                          std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    throw OcrServiceError("Request to " + endpoint + " failed with status code " +
                          std::to_string(http_code) + ": " +
                          response_buffer.substr(0, kMaxErrorBodyChars));
  }

  if (response_buffer.empty()) {
    return nlohmann::json::object();
  }
  try {
    return nlohmann::json::parse(response_buffer);
  } catch (const nlohmann::json::parse_error& e) {
    throw OcrServiceError("Response from " + endpoint + " is not valid JSON: " + e.what());
  }
}

nlohmann::json MistralOcrClient::make_get_request(const std::string& endpoint) {
  std::string response_buffer;
  prepare_request(endpoint, response_buffer);
  HeaderList headers = auth_headers(false);
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  return perform(endpoint, response_buffer);
}

nlohmann::json MistralOcrClient::make_post_request(const std::string& endpoint,
                                                   const nlohmann::json& data) {
  std::string response_buffer;
  const std::string request_json = data.dump();
  prepare_request(endpoint, response_buffer);
  HeaderList headers = auth_headers(true);
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(request_json.size()));
  return perform(endpoint, response_buffer);
}

nlohmann::json MistralOcrClient::make_delete_request(const std::string& endpoint) {
  std::string response_buffer;
  prepare_request(endpoint, response_buffer);
  HeaderList headers = auth_headers(false);
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
  return perform(endpoint, response_buffer);
}

nlohmann::json MistralOcrClient::make_upload_request(const std::string& endpoint,
                                                     const std::string& bytes,
                                                     const std::string& file_name,
                                                     const std::string& purpose) {
  std::string response_buffer;
  prepare_request(endpoint, response_buffer);
  HeaderList headers = auth_headers(false);
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());

  std::unique_ptr<curl_mime, decltype(&curl_mime_free)> form(curl_mime_init(curl_handle_),
                                                             &curl_mime_free);
  if (!form) {
    throw OcrServiceError("Failed to create multipart form for " + file_name);
  }

  curl_mimepart* purpose_part = curl_mime_addpart(form.get());
  curl_mime_name(purpose_part, "purpose");
  curl_mime_data(purpose_part, purpose.c_str(), CURL_ZERO_TERMINATED);

  curl_mimepart* file_part = curl_mime_addpart(form.get());
  curl_mime_name(file_part, "file");
  curl_mime_data(file_part, bytes.data(), bytes.size());
  curl_mime_filename(file_part, file_name.c_str());

  curl_easy_setopt(curl_handle_, CURLOPT_MIMEPOST, form.get());
  return perform(endpoint, response_buffer);
}

std::string MistralOcrClient::stage(const std::string& bytes,
                                    const std::string& file_name,
                                    const std::string& purpose) {
  nlohmann::json response = make_upload_request("/v1/files", bytes, file_name, purpose);
  return OcrResponseParser::parse_file_id(response);
}

std::string MistralOcrClient::locate(const std::string& handle) {
  const std::string endpoint = "/v1/files/" + escape(handle) +
                               "/url?expiry=" + std::to_string(options_.signed_url_expiry_hours);
  nlohmann::json response = make_get_request(endpoint);
  return OcrResponseParser::parse_signed_url(response);
}

OcrResult MistralOcrClient::process(const DocumentRef& document, bool include_images) {
  nlohmann::json response =
      make_post_request("/v1/ocr", build_ocr_request(options_.model, document, include_images));
  return OcrResponseParser::parse_ocr_result(response);
}

void MistralOcrClient::release(const std::string& handle) {
  nlohmann::json response = make_delete_request("/v1/files/" + escape(handle));
  if (response.is_object() && response.contains("deleted") && response["deleted"].is_boolean() &&
      !response["deleted"].get<bool>()) {
    throw OcrServiceError("Service reported file " + handle + " as not deleted");
  }
}

nlohmann::json MistralOcrClient::build_ocr_request(const std::string& model,
                                                   const DocumentRef& document,
                                                   bool include_images) {
  nlohmann::json document_json;
  if (document.type == DocumentRef::Type::DocumentLocator) {
    document_json = {{"type", "document_url"}, {"document_url", document.value}};
  } else {
    document_json = {{"type", "image_url"}, {"image_url", document.value}};
  }

  return {
      {"model", model},
      {"document", document_json},
      {"include_image_base64", include_images}
  };
}

}  // namespace scribe_core
