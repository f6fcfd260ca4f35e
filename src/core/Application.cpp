/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "tasks/TaskService.hpp"
#include "tasks/TaskSettings.hpp"
#include "transfer/TransferFactory.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/PathUtils.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace collector::core {

namespace fs = std::filesystem;

Application::Application() = default;

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
}

bool Application::initialize(const AppOptions& options) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    auto startTime = std::chrono::steady_clock::now();

    const std::string configPath = options.configPath.empty()
        ? utils::PathUtils::getConfigPath().string()
        : options.configPath;

    // Logging comes up at the configured level once the config is read;
    // until then only the console sink exists
    Logger::instance().initialize(options.debug ? LogLevel::Debug : LogLevel::Info, "", false);

    if (!loadConfiguration(configPath)) {
        Logger::instance().error("Failed to load configuration");
        setState(AppState::Error);
        return false;
    }

    LogLevel level = options.debug
        ? LogLevel::Debug
        : Logger::parseLevel(Config::instance().get<std::string>("log.level", "info"));
    Logger::instance().initialize(level, utils::PathUtils::getLogsPath().string(), options.fileLogging);
    Logger::instance().info("{} v{} starting", getName(), getVersion());

    utils::CurlGlobalInit::init();

    utils::HttpOptions http = utils::HttpClient::instance().defaultOptions();
    http.userAgent = getName() + "/" + getVersion();
    utils::HttpClient::instance().setDefaultOptions(http);

    if (!initializeTaskService(options.startReaper)) {
        Logger::instance().error("Failed to initialize task service");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    if (m_taskService) {
        m_taskService->shutdown();
        m_taskService.reset();
    }

    utils::CurlGlobalInit::cleanup();

    Logger::instance().info("Application shutdown complete");
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

bool Application::isRunning() const {
    return m_state.load() == AppState::Ready;
}

tasks::TaskService& Application::taskService() const {
    if (!m_taskService) {
        throw std::logic_error("Task service used before Application::initialize");
    }
    return *m_taskService;
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            Logger::instance().error("State callback error: {}", e.what());
        }
    }
}

bool Application::loadConfiguration(const std::string& path) {
    auto& config = Config::instance();

    try {
        if (fs::exists(path)) {
            if (!config.load(path)) {
                Logger::instance().error("Configuration at {} is unreadable", path);
                return false;
            }
            Logger::instance().info("Configuration loaded from {}", path);
        } else {
            config.setDefaults();
            fs::create_directories(fs::path(path).parent_path());
            if (config.save(path)) {
                Logger::instance().info("Default configuration created at {}", path);
            } else {
                Logger::instance().warn("Could not write default configuration to {}", path);
            }
        }
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to load configuration: {}", e.what());
        return false;
    }
}

bool Application::initializeTaskService(bool startReaper) {
    try {
        const Config& config = Config::instance();
        tasks::TaskSettings settings = tasks::TaskSettings::fromConfig(config);
        transfer::S3Options s3 = transfer::S3Options::fromConfig(config);

        m_taskService = std::make_shared<tasks::TaskService>(
            settings,
            transfer::makeTransferFactory(s3),
            transfer::makeFileWriterFactory());

        if (startReaper) {
            m_taskService->startReaper();
        }

        Logger::instance().debug("Task service ready: {} retries, orphan threshold {}ms",
                                 settings.retryLimit,
                                 settings.orphanThreshold.count());
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Task service initialization error: {}", e.what());
        return false;
    }
}

} // namespace collector::core
