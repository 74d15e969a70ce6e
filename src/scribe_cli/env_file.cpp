#include "scribe_cli/env_file.hpp"

#include <fstream>
#include <iostream>

namespace scribe_cli {

namespace {

std::string trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\r");
  return value.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

EnvMap load_env_file(const std::filesystem::path& env_path) {
  EnvMap values;
  std::ifstream stream(env_path);
  if (!stream.is_open()) {
    return values;
  }

  std::string line;
  int line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line.rfind("export ", 0) == 0) {
      line = trim(line.substr(7));
    }

    const auto equals = line.find('=');
    if (equals == std::string::npos || equals == 0) {
      std::cerr << "Warning: ignoring malformed line " << line_number << " in "
                << env_path.string() << std::endl;
      continue;
    }
    values[trim(line.substr(0, equals))] = unquote(trim(line.substr(equals + 1)));
  }
  return values;
}

}  // namespace scribe_cli
