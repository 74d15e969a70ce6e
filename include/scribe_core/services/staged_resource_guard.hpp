#pragma once

#include <optional>
#include <string>
#include <utility>

#include "scribe_core/ocr/ocr_service.hpp"

namespace scribe_core {

/**
 * @class StagedResourceGuard
 * @brief Owns a staged upload and deletes it exactly once.
 *
 * release() deletes the resource explicitly; the destructor deletes it if
 * release() was never reached. A failed delete is logged and kept as a
 * warning, it is never rethrown.
 */
class StagedResourceGuard {
 public:
  StagedResourceGuard(OcrService& service, std::string handle)
      : service_(service), handle_(std::move(handle)), active_(true) {}

  StagedResourceGuard(const StagedResourceGuard&) = delete;
  StagedResourceGuard& operator=(const StagedResourceGuard&) = delete;

  ~StagedResourceGuard() noexcept { release(); }

  void release() noexcept;

  const std::string& handle() const { return handle_; }
  bool active() const { return active_; }

  // Set when the delete call failed
  const std::optional<std::string>& release_warning() const { return release_warning_; }

 private:
  OcrService& service_;
  std::string handle_;
  bool active_;
  std::optional<std::string> release_warning_;
};

}  // namespace scribe_core
