#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace scribe_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Creates a fresh, empty directory under the system temp directory
  static std::filesystem::path create_temp_directory(const std::string& prefix);

  static std::filesystem::path write_file(const std::filesystem::path& path,
                                          const std::string& content);

  static std::string read_file(const std::filesystem::path& path);
};

/**
 * Base test fixture that provides a scratch directory removed after each test
 */
class TempDirectoryTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = TestUtilities::create_temp_directory("scribe_test");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::filesystem::path create_test_file(const std::string& filename, const std::string& content) {
    return TestUtilities::write_file(test_dir_ / filename, content);
  }

  std::filesystem::path test_dir_;
};

}  // namespace scribe_tests
