#pragma once

#include <atomic>

/**
 * Cooperative cancellation flag shared between the caller and workers.
 * Workers poll isCancelled() between file-level units of work; the
 * subprocess runner polls it while waiting on a child.
 */
class CancellationToken
{
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool isCancelled() const noexcept { return cancelled_.load(); }
    void reset() noexcept { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool isCancelled(const CancellationToken *token)
{
    return token != nullptr && token->isCancelled();
}
