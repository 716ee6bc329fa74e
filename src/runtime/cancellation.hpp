#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace stride::runtime {

namespace detail {

// One-shot stop cell shared by a controller and all of its registrations.
struct CancellationState {
    std::mutex mutex;
    std::condition_variable cancelled_cv;
    bool cancelled = false;
};

}  // namespace detail

// Observing handle. Cheap to copy; every copy sees the same signal.
class CancellationRegistration {
public:
    bool is_cancelled() const;

    // Blocks until the controller is cancelled.
    void wait() const;

    // Returns true if cancelled before the timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationController;
    explicit CancellationRegistration(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

// Triggering handle. Copies share the same state, so a copy kept by a UI
// thread can cancel work started through the original.
class CancellationController {
public:
    CancellationController();

    // Idempotent. Returns true only for the call that flipped the signal.
    bool cancel() const;

    bool is_cancelled() const;

    CancellationRegistration subscribe() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace stride::runtime
