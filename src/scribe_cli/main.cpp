#include "scribe_cli/cli_handler.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <system_error>

namespace {

std::optional<std::filesystem::path> resolve_self_path(const char* argv0) {
  std::error_code ec;
  std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec) {
    return self;
  }
  if (argv0 == nullptr) {
    return std::nullopt;
  }
  self = std::filesystem::absolute(argv0, ec);
  if (ec) {
    return std::nullopt;
  }
  return self;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    scribe_cli::CliHandler handler([](const scribe_core::MistralClientOptions& options) {
      return std::make_shared<scribe_core::MistralOcrClient>(options);
    });

    // Parse command line arguments
    scribe_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    return handler.execute_command(options, resolve_self_path(argc > 0 ? argv[0] : nullptr));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
