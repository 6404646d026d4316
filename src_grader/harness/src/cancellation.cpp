#include "grader_harness/cancellation.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

#include "grader_harness/error_codes.hpp"

namespace grader::harness {

namespace {

// Parent cancellation is observed by polling at this granularity while sleeping.
constexpr std::chrono::milliseconds kParentPollSlice{20};

constexpr std::chrono::milliseconds kNoDeadline{std::chrono::hours(24 * 365)};

}  // namespace

struct CancellationToken::State {
    std::atomic<bool> cancelled{false};
    std::optional<Clock::time_point> deadline;
    std::shared_ptr<State> parent;
    std::mutex mutex;
    std::condition_variable cv;
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

CancellationToken CancellationToken::with_timeout(std::chrono::milliseconds timeout) {
    auto state = std::make_shared<State>();
    state->deadline = Clock::now() + timeout;
    return CancellationToken{std::move(state)};
}

CancellationToken CancellationToken::linked(std::chrono::milliseconds timeout) const {
    auto state = std::make_shared<State>();
    auto deadline = Clock::now() + timeout;
    for (auto node = state_; node; node = node->parent) {
        if (node->deadline) {
            deadline = std::min(deadline, *node->deadline);
        }
    }
    state->deadline = deadline;
    state->parent = state_;
    return CancellationToken{std::move(state)};
}

void CancellationToken::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool CancellationToken::cancel_requested() const {
    for (auto node = state_; node; node = node->parent) {
        if (node->cancelled.load()) {
            return true;
        }
    }
    return false;
}

bool CancellationToken::deadline_passed() const {
    const auto now = Clock::now();
    for (auto node = state_; node; node = node->parent) {
        if (node->deadline && now >= *node->deadline) {
            return true;
        }
    }
    return false;
}

std::chrono::milliseconds CancellationToken::remaining() const {
    std::optional<Clock::time_point> nearest;
    for (auto node = state_; node; node = node->parent) {
        if (node->deadline && (!nearest || *node->deadline < *nearest)) {
            nearest = node->deadline;
        }
    }
    if (!nearest) {
        return kNoDeadline;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*nearest - Clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    const auto wake_at = Clock::now() + duration;
    while (true) {
        if (is_cancelled()) {
            return false;
        }
        const auto now = Clock::now();
        if (now >= wake_at) {
            return true;
        }
        auto slice = std::min<Clock::duration>(wake_at - now, kParentPollSlice);
        slice = std::min<Clock::duration>(slice, remaining());

        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, slice, [this] { return state_->cancelled.load(); });
    }
}

void CancellationToken::throw_if_cancelled(const std::string& what) const {
    if (cancel_requested()) {
        throw TimeoutError(ErrorCode::StepTimeout, what + " cancelled");
    }
    if (deadline_passed()) {
        throw TimeoutError(ErrorCode::StepTimeout, what + " exceeded its deadline");
    }
}

}  // namespace grader::harness
