#include "scribe_core/services/staged_resource_guard.hpp"

#include <iostream>

namespace scribe_core {

void StagedResourceGuard::release() noexcept {
  if (!active_) {
    return;
  }
  // Never retried, even when the delete fails
  active_ = false;

  try {
    std::cout << "    Cleaning up uploaded file: " << handle_ << std::endl;
    service_.release(handle_);
    std::cout << "    Cleaned up uploaded file: " << handle_ << std::endl;
  } catch (const std::exception& e) {
    release_warning_ = "Could not delete uploaded file " + handle_ + ": " + e.what();
    std::cerr << "    Warning: " << *release_warning_ << std::endl;
  }
}

}  // namespace scribe_core
