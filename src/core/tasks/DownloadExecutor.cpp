#include "DownloadExecutor.hpp"
#include "../Logger.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace collector::core::tasks {

namespace fs = std::filesystem;
using transfer::TransferItem;

namespace {

class RetriesExhaustedError : public std::runtime_error {
public:
    explicit RetriesExhaustedError(const std::string& message) : std::runtime_error(message) {}
};

std::optional<uint64_t> sumSizes(const std::vector<TransferItem>& items) {
    uint64_t total = 0;
    for (const auto& item : items) {
        if (!item.size) {
            return std::nullopt;
        }
        total += *item.size;
    }
    return total;
}

} // namespace

std::string startResultToString(StartResult result) {
    switch (result) {
        case StartResult::Accepted:       return "accepted";
        case StartResult::AlreadyRunning: return "already_running";
        default:                          return "unknown";
    }
}

DownloadExecutor::DownloadExecutor(TaskRegistry& registry,
                                   CancellationController& cancellation,
                                   TaskBridge& bridge,
                                   TaskSettings settings,
                                   transfer::TransferFactory transferFactory,
                                   transfer::WriterFactory writerFactory)
    : m_registry(registry)
    , m_cancellation(cancellation)
    , m_bridge(bridge)
    , m_settings(std::move(settings))
    , m_transferFactory(std::move(transferFactory))
    , m_writerFactory(std::move(writerFactory)) {

    if (!m_transferFactory || !m_writerFactory) {
        throw std::invalid_argument("DownloadExecutor needs a transfer and a writer factory");
    }
}

DownloadExecutor::~DownloadExecutor() {
    shutdown();
}

StartResult DownloadExecutor::start(const std::string& id, const JobSpec& spec) {
    std::promise<void> published;
    TaskState pending;
    std::optional<TaskState> failed;
    std::exception_ptr launchFailure;

    {
        std::lock_guard<std::mutex> lock(m_startMutex);

        if (m_stopped) {
            throw std::runtime_error("Executor is shut down");
        }

        // Only start() installs live entries and it holds m_startMutex, so a
        // terminal or missing entry seen here stays that way until insertFresh
        auto existing = m_registry.get(id);
        if (existing && existing->isLive()) {
            Logger::instance().info("Task {} is already {}, start rejected", id, taskStatusToString(existing->status));
            return StartResult::AlreadyRunning;
        }

        // Token first: a cancel that finds the entry must also find its token
        CancellationTokenPtr token = m_cancellation.acquire(id);

        auto fresh = m_registry.insertFresh(id);
        if (!fresh) {
            m_cancellation.release(id, token);
            return StartResult::AlreadyRunning;
        }

        auto ctx = std::make_shared<RunContext>(m_settings.rateWindow);
        ctx->id = id;
        ctx->generation = fresh->generation;
        ctx->spec = spec;
        ctx->token = token;

        pruneHandles();

        std::shared_future<void> done;
        try {
            done = launch(ctx, published.get_future().share());
        } catch (const std::system_error& e) {
            Logger::instance().error("Task {} could not be started: {}", id, e.what());
            m_cancellation.release(id, token);
            launchFailure = std::current_exception();
            failed = m_registry.upsert(id, fresh->generation, [&](TaskState& state) {
                state.status = TaskStatus::Failed;
                state.errorDetail = ErrorDetail{error_codes::Internal, e.what(), std::nullopt, 0};
            });
        }

        pending = *fresh;
        if (!launchFailure) {
            auto previous = m_handles.find(id);
            if (previous != m_handles.end()) {
                m_retired.push_back(previous->second.done);
            }
            m_handles[id] = Handle{fresh->generation, done};

            Logger::instance().info("Task {} accepted: {} -> {}", id, spec.source, spec.destination);
        }
    }

    if (launchFailure) {
        m_bridge.publish(pending);
        if (failed) {
            m_bridge.publish(*failed);
        }
        std::rethrow_exception(launchFailure);
    }

    // Outside the lock so listeners may call back into the executor; the
    // run waits on `published`, which keeps Pending first for this id
    try {
        m_bridge.publish(pending);
    } catch (const std::exception& e) {
        Logger::instance().error("Publishing Pending for {} failed: {}", id, e.what());
    }
    published.set_value();

    return StartResult::Accepted;
}

std::shared_future<void> DownloadExecutor::launch(std::shared_ptr<RunContext> ctx,
                                                  std::shared_future<void> published) {
    return std::async(std::launch::async, [this, ctx, published] {
        published.wait();
        run(*ctx);
    }).share();
}

bool DownloadExecutor::awaitTermination(const std::string& id, std::chrono::milliseconds timeout) {
    std::shared_future<void> done;
    {
        std::lock_guard<std::mutex> lock(m_startMutex);
        auto it = m_handles.find(id);
        if (it == m_handles.end()) {
            return true;
        }
        done = it->second.done;
    }
    return done.wait_for(timeout) == std::future_status::ready;
}

void DownloadExecutor::shutdown() {
    std::unordered_map<std::string, Handle> handles;
    std::vector<std::shared_future<void>> retired;
    {
        std::lock_guard<std::mutex> lock(m_startMutex);
        if (m_stopped) {
            return;
        }
        m_stopped = true;
        handles.swap(m_handles);
        retired.swap(m_retired);
    }

    size_t signaled = m_cancellation.signalAll();
    Logger::instance().info("Executor shutting down, {} task(s) signaled, {} run(s) to join",
                            signaled, handles.size() + retired.size());

    // Runs see their token at the next unit boundary and finish as Cancelled
    for (auto& [id, handle] : handles) {
        handle.done.wait();
    }
    for (auto& done : retired) {
        done.wait();
    }
}

size_t DownloadExecutor::activeCount() const {
    std::lock_guard<std::mutex> lock(m_startMutex);
    size_t count = 0;
    for (const auto& [id, handle] : m_handles) {
        if (handle.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++count;
        }
    }
    for (const auto& done : m_retired) {
        if (done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++count;
        }
    }
    return count;
}

void DownloadExecutor::pruneHandles() {
    // Only finished futures are dropped here; releasing the last reference
    // to a running std::async future would block under m_startMutex
    auto finished = [](const std::shared_future<void>& done) {
        return done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    };

    for (auto it = m_handles.begin(); it != m_handles.end();) {
        if (finished(it->second.done)) {
            it = m_handles.erase(it);
        } else {
            ++it;
        }
    }
    m_retired.erase(std::remove_if(m_retired.begin(), m_retired.end(), finished), m_retired.end());
}

// -- Run loop --

void DownloadExecutor::run(RunContext& ctx) {
    Logger::instance().debug("Task {} picked up (generation {})", ctx.id, ctx.generation);

    try {
        transfer::TransferCapabilityPtr capability = m_transferFactory(ctx.spec);
        if (!capability) {
            throw transfer::FatalTransferError("No transfer capability for " + ctx.spec.source);
        }
        execute(ctx, *capability);

    } catch (const RetriesExhaustedError& e) {
        finishFailed(ctx, error_codes::RetriesExhausted, e.what());
    } catch (const transfer::TransferError& e) {
        finishFailed(ctx, error_codes::Fatal, e.what());
    } catch (const std::exception& e) {
        finishFailed(ctx, error_codes::Internal, e.what());
    }

    m_cancellation.release(ctx.id, ctx.token);
}

void DownloadExecutor::execute(RunContext& ctx, transfer::TransferCapability& capability) {
    if (ctx.token->isSignaled()) {
        finishCancelled(ctx);
        return;
    }

    std::vector<TransferItem> items;
    if (!withRetry(ctx, [&] { items = capability.listItems(ctx.spec); })) {
        finishCancelled(ctx);
        return;
    }

    ctx.totalItems = items.size();
    ctx.totalBytes = sumSizes(items);

    bool running = update(ctx, [&](TaskState& state) {
        state.status = TaskStatus::Running;
        state.startedAt = nowMillis();
        state.totalItems = ctx.totalItems;
        state.totalBytes = ctx.totalBytes;
    });
    if (!running) {
        return;
    }

    Logger::instance().info("Task {} running: {} item(s), {}", ctx.id, ctx.totalItems,
                            ctx.totalBytes ? utils::StringUtils::formatBytes(static_cast<int64_t>(*ctx.totalBytes))
                                           : std::string("size unknown"));

    for (const TransferItem& item : items) {
        if (ctx.token->isSignaled()) {
            finishCancelled(ctx);
            return;
        }

        ctx.item = item.relativePath;
        ctx.attempts = 0;

        fs::path target = utils::PathUtils::resolveBelow(ctx.spec.destination, item.relativePath);
        if (target.empty()) {
            throw transfer::FatalTransferError("Item escapes the destination: " + item.relativePath);
        }

        if (!update(ctx, [&](TaskState& state) { state.currentItem = item.relativePath; })) {
            return;
        }

        uint64_t bytes = 0;
        bool fetched = withRetry(ctx, [&] { bytes = fetchOnce(ctx, capability, item, target); });
        if (ctx.abandoned) {
            return;
        }
        if (!fetched) {
            finishCancelled(ctx);
            return;
        }

        ctx.transferredBytes += bytes;
        ctx.completedItems += 1;
        ctx.rate.sample(RateMeter::SteadyClock::now(), ctx.transferredBytes);
        ctx.lastReport = RateMeter::SteadyClock::now();

        Logger::instance().debug("Task {}: {} done ({} of {})", ctx.id, item.relativePath,
                                 ctx.completedItems, ctx.totalItems);

        bool applied = update(ctx, [&](TaskState& state) {
            state.transferredBytes = ctx.transferredBytes;
            state.completedItems = ctx.completedItems;
            state.transferRate = ctx.rate.rate();
            state.progressPercent = percentOf(ctx);
            state.lastActivityAt = nowMillis();
        });
        if (!applied) {
            return;
        }
    }

    finishCompleted(ctx);
}

bool DownloadExecutor::withRetry(RunContext& ctx, const std::function<void()>& attempt) {
    for (int n = 1;; ++n) {
        ctx.attempts = n;
        try {
            attempt();
            return true;
        } catch (const transfer::TransientTransferError& e) {
            if (n > m_settings.retryLimit) {
                throw RetriesExhaustedError(e.what());
            }

            auto delay = m_settings.backoffFor(n);
            Logger::instance().warn("Task {}: {} (attempt {}/{}), retrying in {}ms",
                                    ctx.id, e.what(), n, m_settings.retryLimit + 1, delay.count());

            if (ctx.token->waitFor(delay)) {
                return false;
            }
        }
    }
}

uint64_t DownloadExecutor::fetchOnce(RunContext& ctx, transfer::TransferCapability& capability,
                                     const TransferItem& item, const fs::path& target) {
    transfer::DestinationWriterPtr writer = m_writerFactory();
    writer->open(target);

    uint64_t inFlight = 0;
    try {
        uint64_t bytes = capability.fetchItem(item, *writer, [&](uint64_t count) {
            inFlight += count;
            reportActivity(ctx, inFlight);
        });
        writer->commit();
        return bytes;
    } catch (const std::exception&) {
        writer->abort();
        throw;
    }
}

void DownloadExecutor::reportActivity(RunContext& ctx, uint64_t inFlightBytes) {
    if (ctx.abandoned) {
        return;
    }

    auto now = RateMeter::SteadyClock::now();
    if (now - ctx.lastReport < m_settings.progressInterval) {
        return;
    }
    ctx.lastReport = now;
    ctx.rate.sample(now, ctx.transferredBytes + inFlightBytes);

    update(ctx, [&](TaskState& state) {
        state.transferRate = ctx.rate.rate();
        state.lastActivityAt = nowMillis();
    });
}

int DownloadExecutor::percentOf(const RunContext& ctx) const {
    if (ctx.totalBytes && *ctx.totalBytes > 0) {
        return static_cast<int>(ctx.transferredBytes * 100 / *ctx.totalBytes);
    }
    if (ctx.totalItems > 0) {
        return static_cast<int>(ctx.completedItems * 100 / ctx.totalItems);
    }
    return 0;
}

bool DownloadExecutor::update(RunContext& ctx, const TaskRegistry::Mutation& mutation) {
    auto state = m_registry.upsert(ctx.id, ctx.generation, mutation);
    if (!state) {
        if (!ctx.abandoned) {
            Logger::instance().info("Task {} (generation {}) no longer owned by this run, stopping",
                                    ctx.id, ctx.generation);
        }
        ctx.abandoned = true;
        return false;
    }
    m_bridge.publish(*state);
    return true;
}

void DownloadExecutor::finishCompleted(RunContext& ctx) {
    bool done = update(ctx, [&](TaskState& state) {
        state.status = TaskStatus::Completed;
        state.currentItem.reset();
        state.transferRate = 0.0;
    });
    if (done) {
        Logger::instance().info("Task {} completed: {} item(s), {}", ctx.id, ctx.completedItems,
                                utils::StringUtils::formatBytes(static_cast<int64_t>(ctx.transferredBytes)));
    }
}

void DownloadExecutor::finishCancelled(RunContext& ctx) {
    bool done = update(ctx, [&](TaskState& state) {
        state.status = TaskStatus::Cancelled;
        state.transferRate = 0.0;
    });
    if (done) {
        Logger::instance().info("Task {} cancelled after {} of {} item(s)", ctx.id,
                                ctx.completedItems, ctx.totalItems);
    }
}

void DownloadExecutor::finishFailed(RunContext& ctx, const std::string& code, const std::string& message) {
    if (ctx.abandoned) {
        return;
    }

    ErrorDetail detail;
    detail.code = code;
    detail.message = message;
    detail.item = ctx.item;
    detail.attempts = ctx.attempts;

    bool done = update(ctx, [&](TaskState& state) {
        state.status = TaskStatus::Failed;
        state.errorDetail = detail;
        state.transferRate = 0.0;
    });
    if (done) {
        Logger::instance().error("Task {} failed ({}): {}", ctx.id, code, message);
    }
}

} // namespace collector::core::tasks
