#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

namespace scribe_cli {

using EnvMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Reads KEY=VALUE pairs from a dotenv file.
 *
 * Blank lines and lines starting with '#' are ignored, a leading "export " is
 * accepted and matching single or double quotes around a value are removed.
 * Lines without '=' are reported on stderr and skipped. A missing file yields
 * an empty map.
 */
EnvMap load_env_file(const std::filesystem::path& env_path);

}  // namespace scribe_cli
