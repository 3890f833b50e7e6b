#pragma once

#include <atomic>
#include <memory>

namespace sandbox_tail {

// Shared cancellation flag. Copies observe the same flag, so a request
// handler can cancel a fetch running on behalf of its cursor.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace sandbox_tail
