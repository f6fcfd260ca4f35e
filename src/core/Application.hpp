#pragma once

/**
 * Application.hpp
 *
 * Lifecycle of the collector process: configuration, logging, the task
 * service and its periodic reaper.
 */

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace collector::core::tasks { class TaskService; }

namespace collector::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

struct AppOptions {
    std::string configPath;   // empty = platform default
    bool debug = false;       // overrides log.level
    bool fileLogging = true;
    bool startReaper = true;
};

/**
 * Main application class
 *
 * Owns the task service for the lifetime of the process. Shutting down
 * cancels whatever is still running and waits for it to finalize.
 */
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all application subsystems
     * @return true if initialization successful
     */
    bool initialize(const AppOptions& options = {});

    /**
     * Shutdown the application gracefully
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }
    bool isRunning() const;

    /**
     * @throws std::logic_error before initialize()
     */
    tasks::TaskService& taskService() const;

    void onStateChange(std::function<void(AppState)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Collector"; }

private:
    void setState(AppState state);

    bool loadConfiguration(const std::string& path);
    bool initializeTaskService(bool startReaper);

    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    std::shared_ptr<tasks::TaskService> m_taskService;
};

} // namespace collector::core
