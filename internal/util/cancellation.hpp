#pragma once

#include <atomic>
#include <memory>

namespace lipsync::util {

/*
  Shared stop flag. Copies observe the same flag; cancelling only stops
  local waiting and reading, nothing is sent to the remote side.
*/
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  void Cancel() {
    flag_->store(true);
  }

  bool IsCancelled() const {
    return flag_->load();
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace lipsync::util
