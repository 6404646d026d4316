#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace grader::harness {

/**
 * \brief Cooperative cancellation with an optional deadline.
 *
 * Tokens are cheap handles onto shared state. A linked token observes the
 * cancellation of its parent and never outlives the parent's deadline, so a
 * per-step token derived from the suite token stops both on step expiry and
 * on suite cancellation.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    /// Token without deadline that is only cancelled explicitly.
    CancellationToken();

    [[nodiscard]] static CancellationToken with_timeout(std::chrono::milliseconds timeout);

    /// Child token: cancelled with the parent, deadline clamped to the parent's.
    [[nodiscard]] CancellationToken linked(std::chrono::milliseconds timeout) const;

    void cancel() const;

    /// True once cancel() was called on this token or an ancestor.
    [[nodiscard]] bool cancel_requested() const;

    /// True once the deadline of this token or an ancestor has passed.
    [[nodiscard]] bool deadline_passed() const;

    [[nodiscard]] bool is_cancelled() const { return cancel_requested() || deadline_passed(); }

    /// Time left until the nearest deadline (a year when no deadline is set).
    [[nodiscard]] std::chrono::milliseconds remaining() const;

    /**
     * Sleeps for \p duration or until the token is cancelled, whichever comes
     * first. Returns true when the full duration elapsed.
     */
    bool sleep_for(std::chrono::milliseconds duration) const;

    /// Throws TimeoutError (StepTimeout) naming \p what when cancelled.
    void throw_if_cancelled(const std::string& what) const;

private:
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

}  // namespace grader::harness
