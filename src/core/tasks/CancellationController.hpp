#pragma once

/**
 * CancellationController.hpp
 *
 * Cooperative per-task stop signals. Executors poll their token at unit
 * boundaries and block on it during retry backoff; nothing here ever
 * interrupts a transfer in progress.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace collector::core::tasks {

class CancellationToken {
public:
    void signal();
    bool isSignaled() const { return m_signaled.load(); }

    /**
     * Sleep for up to `duration`, returning early when signaled.
     * @return true if the token is signaled
     */
    bool waitFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> m_signaled{false};
    std::mutex m_mutex;
    std::condition_variable m_condition;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

enum class SignalResult {
    Ok,
    NotFound
};

class CancellationController {
public:
    CancellationController() = default;

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    /**
     * Allocate a fresh token for id, replacing any token left from an
     * earlier run of the same id
     */
    CancellationTokenPtr acquire(const std::string& id);

    SignalResult signal(const std::string& id);
    bool isSignaled(const std::string& id) const;

    /**
     * Drop the token for id. When `owner` is given the token is only
     * dropped if it is still the one registered, so a finishing run
     * cannot release the token of a newer run.
     */
    void release(const std::string& id, const CancellationTokenPtr& owner = nullptr);

    /**
     * Signal every registered token (shutdown)
     * @return Number of tokens signaled
     */
    size_t signalAll();

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, CancellationTokenPtr> m_tokens;
};

} // namespace collector::core::tasks
