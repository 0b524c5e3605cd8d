#ifndef DOWNLOAD_COORDINATOR_HPP
#define DOWNLOAD_COORDINATOR_HPP

#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace spdlog { class logger; }

enum class DownloadState {Running, Completed, Failed, Cancelled};

inline std::string to_string(DownloadState state) {
    switch (state) {
        case DownloadState::Running: return "running";
        case DownloadState::Completed: return "completed";
        case DownloadState::Failed: return "failed";
        case DownloadState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Handle to one background model pull.
 *
 * Shared between the coordinator, its worker thread and the caller. A job
 * whose cancellation was requested always ends in Cancelled.
 */
class DownloadJob {
public:
    explicit DownloadJob(std::string model);

    const std::string& model() const { return model_; }

    DownloadState state() const;
    std::optional<PullProgress> last_progress() const;
    std::string error_message() const;

    void cancel();
    bool cancel_requested() const { return cancel_requested_.load(); }
    const std::atomic<bool>& cancel_flag() const { return cancel_requested_; }

    /// Blocks until the job reaches a terminal state.
    DownloadState wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class DownloadCoordinator;

    void record_progress(const PullProgress& progress);
    void finish(DownloadState state, std::string error_message = {});

    std::string model_;
    std::atomic<bool> cancel_requested_{false};
    mutable std::mutex mutex_;
    DownloadState state_{DownloadState::Running};
    std::optional<PullProgress> last_progress_;
    std::string error_message_;
    std::promise<DownloadState> done_promise_;
    std::shared_future<DownloadState> done_;
};

struct PullStartResult {
    bool ok = false;
    std::string error_message;
    std::shared_ptr<DownloadJob> job;

    static PullStartResult success(std::shared_ptr<DownloadJob> job) {
        PullStartResult r;
        r.ok = true;
        r.job = std::move(job);
        return r;
    }

    static PullStartResult error(const std::string& msg) {
        PullStartResult r;
        r.error_message = msg;
        return r;
    }
};

/**
 * @brief Runs model pulls on worker threads, one active job per model name.
 */
class DownloadCoordinator {
public:
    using Clock = std::chrono::steady_clock;
    using Now = std::function<Clock::time_point()>;
    using ProgressSink = std::function<void(const PullProgress&)>;
    /// Blocking pull; must honour the cancel flag and may throw on failure.
    using PullFunction = std::function<void(const std::string& model,
                                            const ProgressSink& on_progress,
                                            const std::atomic<bool>* cancel_requested)>;
    using ProgressCallback = std::function<void(const DownloadJob& job, const PullProgress& progress)>;
    using FinishedCallback = std::function<void(const DownloadJob& job)>;

    static constexpr std::chrono::milliseconds kDefaultProgressInterval{2000};

    explicit DownloadCoordinator(PullFunction pull,
                                 std::chrono::milliseconds progress_interval = kDefaultProgressInterval,
                                 Now now = [] { return Clock::now(); });
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    /**
     * @brief Starts pulling model on a worker thread and returns immediately.
     *
     * on_progress is rate-limited to one call per progress interval; the
     * latest record is always available through DownloadJob::last_progress().
     * on_finished runs on the worker thread once state() reports the terminal
     * state and before wait() returns.
     */
    PullStartResult start_pull(const std::string& model,
                               ProgressCallback on_progress = {},
                               FinishedCallback on_finished = {});

    std::shared_ptr<DownloadJob> find_job(const std::string& model) const;
    bool is_active(const std::string& model) const;

    /// Requests cancellation of every job; workers stop at their next check.
    void cancel_all();

private:
    struct Worker {
        std::shared_ptr<DownloadJob> job;
        std::thread thread;
    };

    void run_job(const std::shared_ptr<DownloadJob>& job,
                 const ProgressCallback& on_progress,
                 const FinishedCallback& on_finished);

    PullFunction pull_;
    std::chrono::milliseconds progress_interval_;
    Now now_;
    mutable std::mutex mutex_;
    std::map<std::string, Worker> workers_;
    std::shared_ptr<spdlog::logger> logger_;
};

/// Single-line progress text: bar, percentage and megabytes, or the phase when sizes are unknown.
std::string format_pull_progress(const std::string& model, const PullProgress& progress);

#endif // DOWNLOAD_COORDINATOR_HPP
