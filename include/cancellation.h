#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace viva {

class CancellationSource;

/**
 * @brief Read side of a cancellation signal
 *
 * Copyable and cheap. A default-constructed token is never cancelled.
 * Callbacks registered with on_cancel() run exactly once, on the thread that
 * calls cancel() (or immediately if the token is already cancelled).
 */
class CancellationToken {
public:
    using CallbackId = uint64_t;

    CancellationToken();

    bool is_cancelled() const;
    std::string reason() const;

    CallbackId on_cancel(std::function<void()> callback) const;
    void remove_callback(CallbackId id) const;

    /// New source that is cancelled whenever this token is.
    CancellationSource make_child() const;

private:
    friend class CancellationSource;
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/**
 * @brief Write side of a cancellation signal
 *
 * Each session owns one source; every turn of the session owns a child of it,
 * so abort() cancels everything while a deadline only cancels the turn in flight.
 */
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const;

    /// Idempotent. Cancels linked children as well.
    void cancel(const std::string& reason = "");

    bool is_cancelled() const;

    CancellationSource child() const;

private:
    friend class CancellationToken;
    explicit CancellationSource(std::shared_ptr<CancellationToken::State> state) : state_(std::move(state)) {}

    std::shared_ptr<CancellationToken::State> state_;
};

/**
 * @brief Removes a cancel callback when it goes out of scope
 */
class ScopedCancelCallback {
public:
    ScopedCancelCallback(const CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.on_cancel(std::move(callback))) {}
    ~ScopedCancelCallback() { token_.remove_callback(id_); }

    ScopedCancelCallback(const ScopedCancelCallback&) = delete;
    ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

private:
    CancellationToken token_;
    CancellationToken::CallbackId id_;
};

} // namespace viva
