#pragma once

#include <string>

namespace scribe_core {

// Standard (RFC 4648) base64 with padding and no line breaks
std::string base64_encode(const std::string& bytes);

}  // namespace scribe_core
