#ifndef CAPABILITY_CACHE_HPP
#define CAPABILITY_CACHE_HPP

#include "Types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

class IModelBackend;
namespace Json { class Value; }
namespace spdlog { class logger; }

/**
 * @brief Memoizes per-model vision support discovered through /api/show.
 *
 * Only definitive answers are cached. Unknown results (transport or parse
 * failures) are retried on the next lookup.
 */
class CapabilityCache {
public:
    explicit CapabilityCache(IModelBackend& backend,
                             std::vector<std::string> vision_markers = default_vision_markers());

    static std::vector<std::string> default_vision_markers();

    VisionSupport supports_vision(const std::string& model);

    /// Classifies an /api/show document without touching the cache.
    VisionSupport classify(const Json::Value& show_response) const;

    std::size_t cached_count() const;
    void clear();

private:
    IModelBackend& backend_;
    std::vector<std::string> vision_markers_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, bool> vision_by_model_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // CAPABILITY_CACHE_HPP
