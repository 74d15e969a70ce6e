#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "scribe_cli/config.hpp"
#include "scribe_core/ocr/mistral_ocr_client.hpp"
#include "scribe_core/ocr/ocr_service.hpp"
#include "scribe_core/types/outcome.hpp"

namespace scribe_cli
{

  enum class Command
  {
    Convert,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Convert;
    std::string directory;    // overrides input_directory when set
    std::string config_path;  // optional JSON config file
    bool embed_images = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  // Builds the remote client once the credential is known
  using OcrServiceFactory =
      std::function<std::shared_ptr<scribe_core::OcrService>(const scribe_core::MistralClientOptions &)>;

  // Looks up a process environment variable
  using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &)>;

  class CliHandler
  {
  public:
    explicit CliHandler(OcrServiceFactory service_factory,
                        EnvironmentLookup environment = process_environment);

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]) const;

    // Execute command, returning the process exit status
    int execute_command(const CliOptions &options,
                        const std::optional<std::filesystem::path> &self_path = std::nullopt);

    static std::optional<std::string> process_environment(const std::string &name);

  private:
    OcrServiceFactory service_factory_;
    EnvironmentLookup environment_;

    // Command handlers
    int handle_convert_command(const CliOptions &options,
                               const std::optional<std::filesystem::path> &self_path);
    void handle_help_command() const;

    // Helper methods
    Config load_config(const CliOptions &options) const;
    std::optional<std::string> find_credential(const Config &config) const;
    void print_banner(const Config &config, const std::filesystem::path &directory) const;
    void print_summary(const scribe_core::RunSummary &summary) const;
    void print_error(const std::string &error) const;
  };

}
