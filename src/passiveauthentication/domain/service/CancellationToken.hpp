#pragma once

#include <atomic>

namespace epassport::pa::domain::service {

/**
 * Caller-side cancellation flag, polled between verification steps.
 */
class CancellationToken {
private:
    std::atomic<bool> cancelled_{false};

public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true); }
    bool isCancelled() const noexcept { return cancelled_.load(); }
};

} // namespace epassport::pa::domain::service
