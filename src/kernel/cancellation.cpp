// Nodeweave kernel: cooperative cancellation primitives
#include "kernel/cancellation.hpp"

namespace nw {

CancellationSource::CancellationSource()
    : state_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationSource::cancel() noexcept {
    state_->store(true, std::memory_order_release);
}

bool CancellationSource::cancelled() const noexcept {
    return state_->load(std::memory_order_acquire);
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

void CancellationToken::throw_if_cancelled(const std::string& what) const {
    if (cancelled()) {
        throw ProcessingCancelled(what);
    }
}

} // namespace nw
