#include <gtest/gtest.h>

#include <string>

#include "scribe_core/utils/base64.hpp"

namespace scribe_core {

TEST(Base64Test, Encode_Rfc4648Vectors) {
  EXPECT_EQ(base64_encode(""), "");
  EXPECT_EQ(base64_encode("f"), "Zg==");
  EXPECT_EQ(base64_encode("fo"), "Zm8=");
  EXPECT_EQ(base64_encode("foo"), "Zm9v");
  EXPECT_EQ(base64_encode("foob"), "Zm9vYg==");
  EXPECT_EQ(base64_encode("fooba"), "Zm9vYmE=");
  EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, Encode_BinaryWithNulBytes) {
  const std::string bytes("\x89PNG\r\n\x1a\n\0\0", 10);

  EXPECT_EQ(base64_encode(bytes), "iVBORw0KGgoAAA==");
}

TEST(Base64Test, Encode_LongInput_HasNoLineBreaks) {
  const std::string bytes(3000, 'x');

  const std::string encoded = base64_encode(bytes);

  EXPECT_EQ(encoded.size(), 4000u);
  EXPECT_EQ(encoded.find('\n'), std::string::npos);
}

}  // namespace scribe_core
