#include <catch2/catch.hpp>

#include "DownloadCoordinator.hpp"
#include "GatewayErrors.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

/// Pull function that blocks until released, reporting one record per step.
class BlockingPull {
public:
    void operator()(const std::string&,
                    const DownloadCoordinator::ProgressSink& on_progress,
                    const std::atomic<bool>* cancel_requested) {
        started_.set_value();
        for (int step = 1; ; ++step) {
            if (cancel_requested && cancel_requested->load()) {
                throw OperationCancelledError("cancelled");
            }
            if (release_.load()) {
                return;
            }
            on_progress(PullProgress{"pulling", static_cast<std::uint64_t>(step), 100});
            std::this_thread::sleep_for(5ms);
        }
    }

    void wait_started() { started_future_.wait(); }
    void release() { release_.store(true); }

private:
    std::promise<void> started_;
    std::shared_future<void> started_future_{started_.get_future().share()};
    std::atomic<bool> release_{false};
};

} // namespace

TEST_CASE("DownloadCoordinator completes a pull and reports the last progress") {
    DownloadCoordinator coordinator(
        [](const std::string&, const DownloadCoordinator::ProgressSink& on_progress, const std::atomic<bool>*) {
            on_progress(PullProgress{"pulling manifest", 0, 0});
            on_progress(PullProgress{"downloading", 50, 100});
            on_progress(PullProgress{"success", 100, 100});
        });

    std::atomic<bool> finished_called{false};
    PullStartResult started = coordinator.start_pull("llava", {}, [&](const DownloadJob& job) {
        finished_called = (job.state() == DownloadState::Completed);
    });

    REQUIRE(started.ok);
    REQUIRE(started.job->wait() == DownloadState::Completed);
    REQUIRE(finished_called.load());
    REQUIRE(started.job->error_message().empty());
    const auto progress = started.job->last_progress();
    REQUIRE(progress.has_value());
    REQUIRE(progress->phase == "success");
    REQUIRE(progress->percent() == 100.0);
}

TEST_CASE("DownloadCoordinator runs on_finished after the state is terminal but before wait returns") {
    DownloadCoordinator coordinator(
        [](const std::string&, const DownloadCoordinator::ProgressSink&, const std::atomic<bool>*) {});

    std::atomic<bool> state_was_terminal{false};
    std::atomic<bool> wait_was_ready{true};
    PullStartResult started = coordinator.start_pull("llava", {}, [&](const DownloadJob& job) {
        state_was_terminal = (job.state() == DownloadState::Completed);
        wait_was_ready = job.wait_for(0ms);
    });

    REQUIRE(started.ok);
    REQUIRE(started.job->wait() == DownloadState::Completed);
    REQUIRE(state_was_terminal.load());
    REQUIRE_FALSE(wait_was_ready.load());
}

TEST_CASE("DownloadCoordinator rejects a second pull of an active model") {
    auto pull = std::make_shared<BlockingPull>();
    DownloadCoordinator coordinator(
        [pull](const std::string& model, const DownloadCoordinator::ProgressSink& sink, const std::atomic<bool>* cancel) {
            (*pull)(model, sink, cancel);
        });

    PullStartResult first = coordinator.start_pull("llava");
    REQUIRE(first.ok);
    pull->wait_started();

    PullStartResult second = coordinator.start_pull("llava");
    REQUIRE_FALSE(second.ok);
    REQUIRE(second.error_message.find("already in progress") != std::string::npos);
    REQUIRE(coordinator.is_active("llava"));

    pull->release();
    REQUIRE(first.job->wait() == DownloadState::Completed);
    REQUIRE_FALSE(coordinator.is_active("llava"));
}

TEST_CASE("DownloadCoordinator reports Cancelled, never success, after cancel") {
    auto pull = std::make_shared<BlockingPull>();
    DownloadCoordinator coordinator(
        [pull](const std::string& model, const DownloadCoordinator::ProgressSink& sink, const std::atomic<bool>* cancel) {
            (*pull)(model, sink, cancel);
        });

    PullStartResult started = coordinator.start_pull("mixtral");
    REQUIRE(started.ok);
    pull->wait_started();

    started.job->cancel();
    REQUIRE(started.job->wait_for(5s));
    REQUIRE(started.job->state() == DownloadState::Cancelled);
    REQUIRE(started.job->error_message().empty());
}

TEST_CASE("DownloadCoordinator treats a cancel that races completion as Cancelled") {
    std::promise<void> cancel_sent;
    std::shared_future<void> cancel_ready = cancel_sent.get_future().share();
    DownloadCoordinator coordinator(
        [cancel_ready](const std::string&, const DownloadCoordinator::ProgressSink&, const std::atomic<bool>*) {
            cancel_ready.wait();
        });

    PullStartResult started = coordinator.start_pull("phi3");
    REQUIRE(started.ok);
    started.job->cancel();
    cancel_sent.set_value();

    REQUIRE(started.job->wait() == DownloadState::Cancelled);
}

TEST_CASE("DownloadCoordinator surfaces pull errors as Failed") {
    DownloadCoordinator coordinator(
        [](const std::string&, const DownloadCoordinator::ProgressSink&, const std::atomic<bool>*) {
            throw BackendError(200, "pull model manifest: file does not exist");
        });

    PullStartResult started = coordinator.start_pull("no-such-model");
    REQUIRE(started.ok);
    REQUIRE(started.job->wait() == DownloadState::Failed);
    REQUIRE(started.job->error_message().find("file does not exist") != std::string::npos);

    PullStartResult retry = coordinator.start_pull("no-such-model");
    REQUIRE(retry.ok);
    REQUIRE(retry.job != started.job);
    REQUIRE(retry.job->wait() == DownloadState::Failed);
}

TEST_CASE("DownloadCoordinator rate-limits progress callbacks") {
    auto now = DownloadCoordinator::Clock::time_point{};
    std::mutex clock_mutex;
    DownloadCoordinator coordinator(
        [&](const std::string&, const DownloadCoordinator::ProgressSink& on_progress, const std::atomic<bool>*) {
            for (int second = 1; second <= 6; ++second) {
                {
                    std::lock_guard<std::mutex> lock(clock_mutex);
                    now += std::chrono::seconds(1);
                }
                on_progress(PullProgress{"downloading", static_cast<std::uint64_t>(second), 6});
            }
        },
        std::chrono::milliseconds(2000),
        [&] {
            std::lock_guard<std::mutex> lock(clock_mutex);
            return now;
        });

    std::vector<std::uint64_t> reported;
    std::mutex reported_mutex;
    PullStartResult started = coordinator.start_pull("llama3", [&](const DownloadJob&, const PullProgress& progress) {
        std::lock_guard<std::mutex> lock(reported_mutex);
        reported.push_back(progress.bytes_done);
    });
    REQUIRE(started.ok);
    REQUIRE(started.job->wait() == DownloadState::Completed);

    std::lock_guard<std::mutex> lock(reported_mutex);
    REQUIRE(reported == std::vector<std::uint64_t>{2, 4, 6});
    REQUIRE(started.job->last_progress()->bytes_done == 6);
}

TEST_CASE("DownloadCoordinator rejects blank model names") {
    DownloadCoordinator coordinator(
        [](const std::string&, const DownloadCoordinator::ProgressSink&, const std::atomic<bool>*) {});
    REQUIRE_FALSE(coordinator.start_pull("  ").ok);
}

TEST_CASE("DownloadCoordinator destructor cancels running jobs") {
    auto pull = std::make_shared<BlockingPull>();
    std::shared_ptr<DownloadJob> job;
    {
        DownloadCoordinator coordinator(
            [pull](const std::string& model, const DownloadCoordinator::ProgressSink& sink, const std::atomic<bool>* cancel) {
                (*pull)(model, sink, cancel);
            });
        job = coordinator.start_pull("gemma3").job;
        REQUIRE(job);
        pull->wait_started();
    }
    REQUIRE(job->state() == DownloadState::Cancelled);
}

TEST_CASE("format_pull_progress shows a bar when sizes are known and the phase otherwise") {
    REQUIRE(format_pull_progress("llava", PullProgress{"pulling manifest", 0, 0}) == "llava: pulling manifest");

    const std::string line = format_pull_progress("llava", PullProgress{"downloading", 524288, 1048576});
    REQUIRE(line == "llava: [##########----------] 50.0% (0.5 MB / 1.0 MB)");
}

TEST_CASE("DownloadCoordinator cancel_all stops every running job") {
    std::atomic<int> running{0};
    DownloadCoordinator coordinator(
        [&running](const std::string&, const DownloadCoordinator::ProgressSink&, const std::atomic<bool>* cancel) {
            ++running;
            while (!cancel->load()) {
                std::this_thread::sleep_for(5ms);
            }
            throw OperationCancelledError("cancelled");
        });

    PullStartResult first = coordinator.start_pull("llava");
    PullStartResult second = coordinator.start_pull("mixtral");
    REQUIRE(first.ok);
    REQUIRE(second.ok);
    while (running.load() < 2) {
        std::this_thread::sleep_for(1ms);
    }

    coordinator.cancel_all();

    REQUIRE(first.job->wait_for(5s));
    REQUIRE(second.job->wait_for(5s));
    REQUIRE(first.job->state() == DownloadState::Cancelled);
    REQUIRE(second.job->state() == DownloadState::Cancelled);
    REQUIRE_FALSE(coordinator.is_active("llava"));
    REQUIRE_FALSE(coordinator.is_active("mixtral"));
}
