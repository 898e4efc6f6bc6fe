// Nodeweave kernel: cooperative cancellation primitives
#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "nw_types.hpp"

namespace nw {

class CancellationToken;

// Owner side. Copies share state; cancel() is idempotent and thread-safe.
class CancellationSource {
public:
    CancellationSource();

    void cancel() noexcept;
    bool cancelled() const noexcept;
    CancellationToken token() const;

private:
    friend class CancellationToken;
    std::shared_ptr<std::atomic<bool>> state_;
};

// Observer side handed to work items. A default-constructed token is never
// cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool cancelled() const noexcept { return state_ && state_->load(std::memory_order_acquire); }
    void throw_if_cancelled(const std::string& what) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> state) : state_(std::move(state)) {}
    std::shared_ptr<std::atomic<bool>> state_;
};

// Blocks until `fut` is ready while polling the token. Throws
// ProcessingCancelled when the token fires first; the future is abandoned.
template <typename Future>
void wait_until_ready(const Future& fut, const CancellationToken& token, const std::string& what,
                      std::chrono::milliseconds poll = std::chrono::milliseconds(5)) {
    while (fut.wait_for(poll) != std::future_status::ready) {
        token.throw_if_cancelled(what);
    }
    token.throw_if_cancelled(what);
}

template <typename T>
T wait_cancellable(std::future<T>& fut, const CancellationToken& token, const std::string& what,
                   std::chrono::milliseconds poll = std::chrono::milliseconds(5)) {
    wait_until_ready(fut, token, what, poll);
    return fut.get();
}

} // namespace nw
