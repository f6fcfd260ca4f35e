#include "CancellationController.hpp"
#include "../Logger.hpp"

#include <vector>

namespace collector::core::tasks {

// -- CancellationToken --

void CancellationToken::signal() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_signaled = true;
    }
    m_condition.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, duration, [this] { return m_signaled.load(); });
}

// -- CancellationController --

CancellationTokenPtr CancellationController::acquire(const std::string& id) {
    auto token = std::make_shared<CancellationToken>();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_tokens[id] = token;
    return token;
}

SignalResult CancellationController::signal(const std::string& id) {
    CancellationTokenPtr token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tokens.find(id);
        if (it == m_tokens.end()) {
            return SignalResult::NotFound;
        }
        token = it->second;
    }

    token->signal();
    Logger::instance().debug("Cancellation signaled for {}", id);
    return SignalResult::Ok;
}

bool CancellationController::isSignaled(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tokens.find(id);
    return it != m_tokens.end() && it->second->isSignaled();
}

void CancellationController::release(const std::string& id, const CancellationTokenPtr& owner) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tokens.find(id);
    if (it == m_tokens.end()) {
        return;
    }
    if (owner && it->second != owner) {
        return;
    }
    m_tokens.erase(it);
}

size_t CancellationController::signalAll() {
    std::vector<CancellationTokenPtr> tokens;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tokens.reserve(m_tokens.size());
        for (const auto& [id, token] : m_tokens) {
            tokens.push_back(token);
        }
    }

    for (const auto& token : tokens) {
        token->signal();
    }
    return tokens.size();
}

size_t CancellationController::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tokens.size();
}

} // namespace collector::core::tasks
