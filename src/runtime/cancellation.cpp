#include "runtime/cancellation.hpp"

#include <utility>

namespace stride::runtime {

CancellationRegistration::CancellationRegistration(
    std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationRegistration::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void CancellationRegistration::wait() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cancelled_cv.wait(lock, [this]() { return state_->cancelled; });
}

bool CancellationRegistration::wait_for(const std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cancelled_cv.wait_for(lock, timeout,
                                         [this]() { return state_->cancelled; });
}

CancellationController::CancellationController()
    : state_(std::make_shared<detail::CancellationState>()) {}

bool CancellationController::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return false;
        }
        state_->cancelled = true;
    }
    state_->cancelled_cv.notify_all();
    return true;
}

bool CancellationController::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration CancellationController::subscribe() const {
    return CancellationRegistration(state_);
}

}  // namespace stride::runtime
