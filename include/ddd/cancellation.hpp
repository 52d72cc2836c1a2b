#pragma once

#include <atomic>
#include <memory>

namespace ddd {

/**
 * Shared cancellation flag. Copies observe the same flag, so one copy can be
 * handed to a UnitOfWork and another kept by whoever may cancel it.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }

    bool is_cancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace ddd
