#include "ModelInventory.hpp"
#include "IModelBackend.hpp"
#include "Logger.hpp"

#include <spdlog/spdlog.h>

ModelInventory::ModelInventory(IModelBackend& backend, std::chrono::seconds ttl, Now now)
    : backend_(backend),
      ttl_(ttl),
      now_(std::move(now))
{
    logger_ = Logger::get_logger("core_logger");
}

bool ModelInventory::is_fresh_locked(Clock::time_point now) const
{
    return fetched_at_.has_value()
        && !models_.empty()
        && (now - *fetched_at_) < ttl_;
}

std::vector<std::string> ModelInventory::models()
{
    const auto now = now_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_fresh_locked(now)) {
            return models_;
        }
    }

    // The lock is not held across the network call.
    ListModelsResult result = backend_.list_models();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!result.ok) {
        if (logger_) {
            logger_->warn("inventory_refresh_failed error={} serving={}", result.error_message, models_.size());
        }
        return models_;
    }

    models_ = std::move(result.models);
    fetched_at_ = now;
    if (logger_) {
        logger_->debug("inventory_refreshed count={}", models_.size());
    }
    return models_;
}

void ModelInventory::invalidate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    fetched_at_.reset();
}

std::optional<ModelInventory::Clock::time_point> ModelInventory::fetched_at() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return fetched_at_;
}
