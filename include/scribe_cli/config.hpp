#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace scribe_cli {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
 public:
  std::string api_base_url;
  std::string api_key_env;
  std::string model;
  bool embed_images;
  std::vector<std::string> supported_extensions;
  std::string input_directory;
  long request_timeout_seconds;
  int signed_url_expiry_hours;
  std::string env_file;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename + "': " +
                        e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object, applying defaults for missing keys
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Configuration must be a JSON object");
    }

    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("https://api.mistral.ai"));
      config.api_key_env = json_config.value("api_key_env", std::string("MISTRAL_API_KEY"));
      config.model = json_config.value("model", std::string("mistral-ocr-latest"));
      config.embed_images = json_config.value("embed_images", false);
      config.supported_extensions = json_config.value(
          "supported_extensions",
          std::vector<std::string>{".pdf", ".png", ".jpg", ".jpeg", ".webp"});
      config.input_directory = json_config.value("input_directory", std::string("."));
      config.request_timeout_seconds = json_config.value("request_timeout_seconds", 0L);
      config.signed_url_expiry_hours = json_config.value("signed_url_expiry_hours", 24);
      config.env_file = json_config.value("env_file", std::string(".env"));
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    config.normalize();
    config.validate();
    return config;
  }

  static Config defaults() { return from_json(nlohmann::json::object()); }

  std::set<std::string> extension_set() const {
    return std::set<std::string>(supported_extensions.begin(), supported_extensions.end());
  }

  // Re-check after command-line overrides
  void validate() const {
    if (api_base_url.empty()) {
      throw ConfigError("api_base_url cannot be empty");
    }
    if (api_key_env.empty()) {
      throw ConfigError("api_key_env cannot be empty");
    }
    if (model.empty()) {
      throw ConfigError("model cannot be empty");
    }
    if (input_directory.empty()) {
      throw ConfigError("input_directory cannot be empty");
    }
    if (supported_extensions.empty()) {
      throw ConfigError("supported_extensions cannot be empty");
    }
    for (const auto& ext : supported_extensions) {
      if (ext.size() < 2 || ext[0] != '.') {
        throw ConfigError("supported_extensions entry '" + ext + "' must start with '.'");
      }
      if (ext == ".md") {
        throw ConfigError("supported_extensions cannot contain .md, it is the output format");
      }
    }
    if (request_timeout_seconds < 0) {
      throw ConfigError("request_timeout_seconds cannot be negative");
    }
    if (signed_url_expiry_hours < 1) {
      throw ConfigError("signed_url_expiry_hours must be at least 1 hour");
    }
  }

 private:
  void normalize() {
    for (auto& ext : supported_extensions) {
      std::transform(ext.begin(), ext.end(), ext.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
  }
};

}  // namespace scribe_cli
