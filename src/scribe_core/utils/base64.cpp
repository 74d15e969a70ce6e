#include "scribe_core/utils/base64.hpp"

#include <openssl/evp.h>

#include <limits>
#include <stdexcept>
#include <vector>

namespace scribe_core {

std::string base64_encode(const std::string& bytes) {
  if (bytes.empty()) {
    return "";
  }
  if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
    throw std::runtime_error("Payload too large to base64-encode");
  }

  // EVP_EncodeBlock writes 4 output characters per 3 input bytes plus a NUL
  std::vector<unsigned char> encoded(4 * ((bytes.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(encoded.data(),
                                      reinterpret_cast<const unsigned char*>(bytes.data()),
                                      static_cast<int>(bytes.size()));
  if (written < 0) {
    throw std::runtime_error("Base64 encoding failed");
  }
  return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(written));
}

}  // namespace scribe_core
