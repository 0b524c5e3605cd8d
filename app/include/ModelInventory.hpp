#ifndef MODEL_INVENTORY_HPP
#define MODEL_INVENTORY_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class IModelBackend;
namespace spdlog { class logger; }

/**
 * @brief TTL-bound snapshot of the models installed on the local backend.
 *
 * A failed refresh keeps serving the previous snapshot (or an empty list when
 * nothing was ever fetched).
 */
class ModelInventory {
public:
    using Clock = std::chrono::steady_clock;
    using Now = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultTtl{60};

    explicit ModelInventory(IModelBackend& backend,
                            std::chrono::seconds ttl = kDefaultTtl,
                            Now now = [] { return Clock::now(); });

    /// Returns the snapshot, refreshing it first when it is stale or empty.
    std::vector<std::string> models();

    void invalidate();
    std::optional<Clock::time_point> fetched_at() const;

private:
    bool is_fresh_locked(Clock::time_point now) const;

    IModelBackend& backend_;
    std::chrono::seconds ttl_;
    Now now_;
    mutable std::mutex mutex_;
    std::vector<std::string> models_;
    std::optional<Clock::time_point> fetched_at_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // MODEL_INVENTORY_HPP
