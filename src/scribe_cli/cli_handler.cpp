#include "scribe_cli/cli_handler.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

#include "scribe_cli/env_file.hpp"
#include "scribe_core/errors.hpp"
#include "scribe_core/services/batch_orchestrator.hpp"
#include "scribe_core/services/document_pipeline.hpp"
#include "scribe_core/services/markdown_synthesizer.hpp"

namespace scribe_cli {

CliHandler::CliHandler(OcrServiceFactory service_factory, EnvironmentLookup environment)
    : service_factory_(std::move(service_factory)), environment_(std::move(environment)) {
    if (!service_factory_) {
        throw CliError("CliHandler requires an OCR service factory");
    }
    if (!environment_) {
        environment_ = process_environment;
    }
}

std::optional<std::string> CliHandler::process_environment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) const {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            options.command = Command::Help;
        } else if (flag == "--embed-images" || flag == "-e") {
            options.embed_images = true;
        } else if (flag == "--dir" || flag == "-d") {
            if (i + 1 >= argc) {
                throw CliError("--dir requires a directory. Usage: scribe --dir <path>");
            }
            options.directory = argv[++i];
        } else if (flag == "--config" || flag == "-c") {
            if (i + 1 >= argc) {
                throw CliError("--config requires a file path. Usage: scribe --config <file>");
            }
            options.config_path = argv[++i];
        } else {
            throw CliError("Unknown argument: " + flag + " (see --help)");
        }
    }
    return options;
}

int CliHandler::execute_command(const CliOptions& options,
                                const std::optional<std::filesystem::path>& self_path) {
    switch (options.command) {
        case Command::Help:
            handle_help_command();
            return 0;
        case Command::Convert:
            return handle_convert_command(options, self_path);
        default:
            print_error("Unknown command");
            return 1;
    }
}

Config CliHandler::load_config(const CliOptions& options) const {
    Config config = options.config_path.empty() ? Config::defaults()
                                                : Config::from_file(options.config_path);
    if (!options.directory.empty()) {
        config.input_directory = options.directory;
    }
    if (options.embed_images) {
        config.embed_images = true;
    }
    config.validate();
    return config;
}

// The real environment wins over the .env file
std::optional<std::string> CliHandler::find_credential(const Config& config) const {
    std::optional<std::string> value = environment_(config.api_key_env);
    if (!value) {
        EnvMap env_file = load_env_file(config.env_file);
        auto it = env_file.find(config.api_key_env);
        if (it != env_file.end()) {
            value = it->second;
        }
    }
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

int CliHandler::handle_convert_command(const CliOptions& options,
                                       const std::optional<std::filesystem::path>& self_path) {
    Config config;
    try {
        config = load_config(options);
    } catch (const ConfigError& e) {
        print_error(e.what());
        return 1;
    }

    std::optional<std::string> api_key = find_credential(config);
    if (!api_key) {
        print_error(config.api_key_env + " not found in environment variables or " +
                    config.env_file + " file.");
        return 1;
    }
    std::cout << "API key loaded from " << config.api_key_env << "." << std::endl;

    scribe_core::MistralClientOptions client_options;
    client_options.api_base_url = config.api_base_url;
    client_options.api_key = *api_key;
    client_options.model = config.model;
    client_options.request_timeout_seconds = config.request_timeout_seconds;
    client_options.signed_url_expiry_hours = config.signed_url_expiry_hours;

    std::shared_ptr<scribe_core::OcrService> ocr_service;
    try {
        ocr_service = service_factory_(client_options);
    } catch (const scribe_core::OcrClientError& e) {
        print_error("Error initializing OCR client: " + std::string(e.what()));
        return 1;
    }
    if (!ocr_service) {
        print_error("Error initializing OCR client: no client was created");
        return 1;
    }
    std::cout << "OCR client initialized." << std::endl;

    scribe_core::PipelineOptions pipeline_options;
    pipeline_options.embed_images = config.embed_images;

    scribe_core::BatchOptions batch_options;
    batch_options.supported_extensions = config.extension_set();
    batch_options.embed_images = config.embed_images;
    batch_options.self_path = self_path;

    scribe_core::BatchOrchestrator orchestrator(
        std::make_shared<scribe_core::DocumentPipeline>(ocr_service, pipeline_options),
        std::make_shared<scribe_core::MarkdownSynthesizer>(), batch_options);

    const std::filesystem::path directory(config.input_directory);
    print_banner(config, directory);

    scribe_core::RunSummary summary;
    try {
        summary = orchestrator.run_batch(directory);
    } catch (const scribe_core::DirectoryListError& e) {
        print_error(e.what());
        return 1;
    }

    if (summary.candidates == 0) {
        return 0;
    }
    print_summary(summary);
    return summary.has_errors() ? 1 : 0;
}

void CliHandler::print_banner(const Config& config, const std::filesystem::path& directory) const {
    std::error_code ec;
    std::filesystem::path shown = std::filesystem::absolute(directory, ec);
    if (ec) {
        shown = directory;
    }

    std::cout << "\nStarting OCR processing in directory: " << shown.string() << std::endl;
    std::cout << "Include base64 images from PDFs: " << (config.embed_images ? "true" : "false")
              << std::endl;
    std::cout << "Supported extensions:";
    for (const auto& ext : config.supported_extensions) {
        std::cout << " " << ext;
    }
    std::cout << "\n" << std::endl;
}

void CliHandler::print_summary(const scribe_core::RunSummary& summary) const {
    std::cout << "\n--- Processing Summary ---" << std::endl;
    std::cout << "Files processed successfully: " << summary.processed << std::endl;
    std::cout << "Files skipped (already processed, self, etc.): " << summary.skipped << std::endl;
    std::cout << "Errors encountered: " << summary.errors << std::endl;

    for (const auto& file : summary.files) {
        if (file.outcome == scribe_core::Outcome::Failed) {
            std::cout << "  " << file.file_name << ": "
                      << (file.error_kind ? scribe_core::to_string(*file.error_kind) : "Error")
                      << " - " << file.message << std::endl;
        }
    }
    std::cout << "--------------------------\n" << std::endl;
}

void CliHandler::print_error(const std::string& error) const {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::handle_help_command() const {
    std::cout << "Scribe - convert PDFs and images to Markdown with a remote OCR service\n\n";
    std::cout << "Usage: scribe [options]\n\n";
    std::cout << "Every .pdf, .png, .jpg, .jpeg and .webp file in the directory is converted\n";
    std::cout << "into a .md file with the same name. Files that already have a .md are skipped.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --dir <path>       Directory to convert (default: current directory)\n";
    std::cout << "  -c, --config <file>    JSON configuration file\n";
    std::cout << "  -e, --embed-images     Embed page images of PDFs as base64 data URLs\n";
    std::cout << "  -h, --help             Show this help message\n\n";
    std::cout << "Environment:\n";
    std::cout << "  MISTRAL_API_KEY        API key (also read from a .env file)\n";
}

}  // namespace scribe_cli
