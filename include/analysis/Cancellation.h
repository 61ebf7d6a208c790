/***
 * Name: pyinfer::analysis::CancellationSource / CancellationToken
 * Purpose: Cooperative cancellation checked by the scheduler between analysis units.
 */
#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace pyinfer::analysis {

    class CancellationToken {
    public:
        // A default token is never cancelled.
        CancellationToken() = default;

        bool isCancellationRequested() const { return flag_ && flag_->load(std::memory_order_acquire); }

    private:
        friend class CancellationSource;
        explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag) : flag_(std::move(flag)) {}

        std::shared_ptr<const std::atomic<bool>> flag_{};
    };

    class CancellationSource {
    public:
        CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() { flag_->store(true, std::memory_order_release); }
        CancellationToken token() const { return CancellationToken(flag_); }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

} // namespace pyinfer::analysis
