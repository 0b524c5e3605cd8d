#include "DownloadCoordinator.hpp"
#include "GatewayErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace {

constexpr int kProgressBarWidth = 20;

}

DownloadJob::DownloadJob(std::string model)
    : model_(std::move(model)),
      done_(done_promise_.get_future().share())
{
}

DownloadState DownloadJob::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<PullProgress> DownloadJob::last_progress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_progress_;
}

std::string DownloadJob::error_message() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return error_message_;
}

void DownloadJob::cancel()
{
    cancel_requested_.store(true);
}

DownloadState DownloadJob::wait() const
{
    return done_.get();
}

bool DownloadJob::wait_for(std::chrono::milliseconds timeout) const
{
    return done_.wait_for(timeout) == std::future_status::ready;
}

void DownloadJob::record_progress(const PullProgress& progress)
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_progress_ = progress;
}

void DownloadJob::finish(DownloadState state, std::string error_message)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        error_message_ = std::move(error_message);
    }
    done_promise_.set_value(state);
}

DownloadCoordinator::DownloadCoordinator(PullFunction pull,
                                         std::chrono::milliseconds progress_interval,
                                         Now now)
    : pull_(std::move(pull)),
      progress_interval_(progress_interval),
      now_(std::move(now))
{
    logger_ = Logger::get_logger("core_logger");
}

DownloadCoordinator::~DownloadCoordinator()
{
    std::map<std::string, Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& [model, worker] : workers) {
        worker.job->cancel();
    }
    for (auto& [model, worker] : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

PullStartResult DownloadCoordinator::start_pull(const std::string& model,
                                                ProgressCallback on_progress,
                                                FinishedCallback on_finished)
{
    if (Utils::trim(model).empty()) {
        return PullStartResult::error("Model name is required");
    }

    std::thread finished_thread;
    PullStartResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(model);
        if (it != workers_.end()) {
            if (it->second.job->state() == DownloadState::Running) {
                if (logger_) {
                    logger_->info("pull_rejected model={} reason=already_in_progress", model);
                }
                return PullStartResult::error("Download of " + model + " is already in progress");
            }
            finished_thread = std::move(it->second.thread);
            workers_.erase(it);
        }

        auto job = std::make_shared<DownloadJob>(model);
        Worker worker;
        worker.job = job;
        worker.thread = std::thread([this, job, on_progress = std::move(on_progress), on_finished = std::move(on_finished)] {
            run_job(job, on_progress, on_finished);
        });
        workers_.emplace(model, std::move(worker));
        result = PullStartResult::success(job);
    }

    // The previous job for this model is already terminal.
    if (finished_thread.joinable()) {
        if (finished_thread.get_id() == std::this_thread::get_id()) {
            finished_thread.detach();
        } else {
            finished_thread.join();
        }
    }

    if (logger_) {
        logger_->info("pull_started model={}", model);
    }
    return result;
}

void DownloadCoordinator::run_job(const std::shared_ptr<DownloadJob>& job,
                                  const ProgressCallback& on_progress,
                                  const FinishedCallback& on_finished)
{
    auto last_emit = now_();
    const ProgressSink sink = [&](const PullProgress& progress) {
        job->record_progress(progress);
        const auto now = now_();
        if (on_progress && now - last_emit >= progress_interval_) {
            last_emit = now;
            on_progress(*job, progress);
        }
    };

    DownloadState state = DownloadState::Completed;
    std::string error;
    try {
        pull_(job->model(), sink, &job->cancel_flag());
    } catch (const OperationCancelledError&) {
        state = DownloadState::Cancelled;
    } catch (const std::exception& ex) {
        state = DownloadState::Failed;
        error = ex.what();
    }

    if (job->cancel_requested()) {
        state = DownloadState::Cancelled;
        error.clear();
    }

    if (logger_) {
        if (state == DownloadState::Failed) {
            logger_->error("pull_finished model={} state={} error={}", job->model(), to_string(state), error);
        } else {
            logger_->info("pull_finished model={} state={}", job->model(), to_string(state));
        }
    }

    {
        std::lock_guard<std::mutex> lock(job->mutex_);
        job->state_ = state;
        job->error_message_ = error;
    }
    if (on_finished) {
        try {
            on_finished(*job);
        } catch (const std::exception& ex) {
            if (logger_) {
                logger_->warn("pull_finished_callback_failed model={} error={}", job->model(), ex.what());
            }
        }
    }
    job->finish(state, std::move(error));
}

std::shared_ptr<DownloadJob> DownloadCoordinator::find_job(const std::string& model) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(model);
    return it == workers_.end() ? nullptr : it->second.job;
}

bool DownloadCoordinator::is_active(const std::string& model) const
{
    auto job = find_job(model);
    return job && !job->wait_for(std::chrono::milliseconds(0));
}

void DownloadCoordinator::cancel_all()
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [model, worker] : workers_) {
        worker.job->cancel();
    }
}

std::string format_pull_progress(const std::string& model, const PullProgress& progress)
{
    if (!progress.has_sizes()) {
        return fmt::format("{}: {}", model, progress.phase.empty() ? "working" : progress.phase);
    }

    const double percent = std::min(100.0, progress.percent());
    const int filled = static_cast<int>(percent / 100.0 * kProgressBarWidth);
    std::string bar(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(kProgressBarWidth - filled), '-');
    return fmt::format("{}: [{}] {:.1f}% ({} / {})",
                       model, bar, percent,
                       Utils::format_megabytes(progress.bytes_done),
                       Utils::format_megabytes(progress.bytes_total));
}
