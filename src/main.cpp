/**
 * Collector - background dataset downloader
 *
 * Command line entry point. Starts one or more transfer tasks, follows
 * their events until every one is terminal and reports the outcome.
 */

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Application.hpp"
#include "core/Logger.hpp"
#include "core/tasks/TaskService.hpp"
#include "utils/StringUtils.hpp"

using collector::core::Application;
using collector::core::AppOptions;
using collector::core::AppState;
using collector::core::Logger;
using collector::utils::StringUtils;
namespace tasks = collector::core::tasks;

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

/**
 * Only records the request; the main loop cancels the tasks
 */
void signalHandler(int) {
    g_stopRequested = 1;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

struct CliJob {
    std::string id;
    tasks::JobSpec spec;
};

struct CliArgs {
    AppOptions app;
    std::vector<CliJob> jobs;
    std::string jobsFile;
    bool snapshot = false;
};

void printUsage(const char* program) {
    std::cout << Application::getName() << " - background dataset downloader\n"
              << "\nUsage: " << program << " [options] <task-id> <source> <destination>\n"
              << "       " << program << " [options] --jobs <jobs.json>\n"
              << "\nSources: s3://bucket/prefix, file:///dir or a local directory\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Use this configuration file\n"
              << "  -j, --jobs <path>    Read a JSON array of {task_id, source, destination}\n"
              << "  -s, --snapshot       Print the final state of every task as JSON\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

std::vector<CliJob> loadJobs(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open jobs file " + path);
    }

    nlohmann::json document = nlohmann::json::parse(file);
    const nlohmann::json& list = document.is_object() ? document.at("jobs") : document;
    if (!list.is_array()) {
        throw std::runtime_error("Jobs file must hold an array of jobs");
    }

    std::vector<CliJob> jobs;
    for (const auto& entry : list) {
        CliJob job;
        job.id = entry.at("task_id").get<std::string>();
        job.spec = tasks::JobSpec::fromJson(entry);
        jobs.push_back(std::move(job));
    }
    return jobs;
}

/**
 * @return -1 to continue, otherwise the exit code
 */
int parseArgs(int argc, char* argv[], CliArgs& args) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            args.app.debug = true;
        } else if (arg == "--snapshot" || arg == "-s") {
            args.snapshot = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.app.configPath = argv[++i];
        } else if ((arg == "--jobs" || arg == "-j") && i + 1 < argc) {
            args.jobsFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            return 0;
        } else if (StringUtils::startsWith(arg, "-")) {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() == 3) {
        CliJob job;
        job.id = positional[0];
        job.spec.source = positional[1];
        job.spec.destination = positional[2];
        args.jobs.push_back(std::move(job));
    } else if (!positional.empty() || args.jobsFile.empty()) {
        printUsage(argv[0]);
        return 2;
    }
    return -1;
}

void printEvent(const tasks::TaskEvent& event) {
    const tasks::TaskState& state = event.state;

    std::cout << "[" << state.taskId << "] " << tasks::taskStatusToString(state.status)
              << " " << state.progressPercent << "%"
              << " " << state.completedItems << "/" << state.totalItems << " items"
              << " " << StringUtils::formatBytes(static_cast<int64_t>(state.transferredBytes));
    if (state.totalBytes) {
        std::cout << " of " << StringUtils::formatBytes(static_cast<int64_t>(*state.totalBytes));
    }
    if (state.transferRate > 0.0) {
        std::cout << " @ " << StringUtils::formatRate(state.transferRate);
    }
    if (state.currentItem && !state.isTerminal()) {
        std::cout << " (" << *state.currentItem << ")";
    }
    if (state.errorDetail) {
        std::cout << " error[" << state.errorDetail->code << "]: " << state.errorDetail->message;
    }
    std::cout << std::endl;
}

bool allTerminal(const tasks::TaskService& service, const std::set<std::string>& ids) {
    for (const auto& id : ids) {
        auto state = service.getProgress(id);
        if (state && state->isLive()) {
            return false;
        }
    }
    return true;
}

int runJobs(Application& app, const CliArgs& args) {
    auto& logger = Logger::instance();
    tasks::TaskService& service = app.taskService();

    auto stream = service.subscribe();
    std::set<std::string> started;

    for (const auto& job : args.jobs) {
        tasks::StartResult result = service.startTask(job.id, job.spec);
        if (result == tasks::StartResult::Accepted) {
            started.insert(job.id);
        } else {
            logger.warn("Task {} not started: {}", job.id, tasks::startResultToString(result));
        }
    }

    bool cancelling = false;
    while (app.isRunning() && !allTerminal(service, started)) {
        if (g_stopRequested && !cancelling) {
            logger.info("Interrupted, cancelling {} task(s)", started.size());
            service.cancelAll();
            cancelling = true;
        }

        if (auto event = stream->next(std::chrono::milliseconds(200))) {
            if (started.count(event->state.taskId) > 0) {
                printEvent(*event);
            }
        }
    }

    // Drain what arrived after the last poll
    while (auto event = stream->next(std::chrono::milliseconds(0))) {
        if (started.count(event->state.taskId) > 0) {
            printEvent(*event);
        }
    }
    if (stream->dropped() > 0) {
        logger.debug("{} progress event(s) dropped by the console stream", stream->dropped());
    }

    if (args.snapshot) {
        nlohmann::json snapshot = nlohmann::json::array();
        for (const auto& state : service.getAllProgress()) {
            snapshot.push_back(state.toJson());
        }
        std::cout << snapshot.dump(2) << std::endl;
    }

    int exitCode = started.size() == args.jobs.size() ? 0 : 1;
    for (const auto& id : started) {
        auto state = service.getProgress(id);
        if (!state || state->status != tasks::TaskStatus::Completed) {
            exitCode = 1;
        }
    }
    return exitCode;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    int parsed = parseArgs(argc, argv, args);
    if (parsed >= 0) {
        return parsed;
    }

    try {
        if (!args.jobsFile.empty()) {
            auto fromFile = loadJobs(args.jobsFile);
            args.jobs.insert(args.jobs.end(), fromFile.begin(), fromFile.end());
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid jobs file: " << e.what() << std::endl;
        return 2;
    }

    setupSignalHandlers();

    Application app;
    app.onStateChange([](AppState state) {
        if (state == AppState::Error) {
            std::cerr << "Collector failed to start, see the log for details" << std::endl;
        }
    });

    try {
        if (!app.initialize(args.app)) {
            Logger::instance().critical("Failed to initialize application");
            return 1;
        }

        int exitCode = runJobs(app, args);
        app.shutdown();
        return exitCode;

    } catch (const std::exception& e) {
        Logger::instance().critical("Unhandled exception: {}", e.what());
        app.shutdown();
        return 1;
    }
}
