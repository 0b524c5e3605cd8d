#include "CapabilityCache.hpp"
#include "GatewayErrors.hpp"
#include "IModelBackend.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

CapabilityCache::CapabilityCache(IModelBackend& backend, std::vector<std::string> vision_markers)
    : backend_(backend),
      vision_markers_(std::move(vision_markers))
{
    logger_ = Logger::get_logger("core_logger");
}

std::vector<std::string> CapabilityCache::default_vision_markers()
{
    return {"vision", "clip", "mmproj", "image", "projector"};
}

VisionSupport CapabilityCache::classify(const Json::Value& show_response) const
{
    if (!show_response.isObject()) {
        return VisionSupport::Unknown;
    }

    const Json::Value& capabilities = show_response["capabilities"];
    if (capabilities.isArray() && !capabilities.empty()) {
        for (const auto& capability : capabilities) {
            if (capability.isString() && Utils::to_lower(capability.asString()) == "vision") {
                return VisionSupport::Supported;
            }
        }
        return VisionSupport::Unsupported;
    }

    const Json::Value& model_info = show_response["model_info"];
    if (model_info.isObject() && !model_info.empty()) {
        for (const auto& key : model_info.getMemberNames()) {
            const std::string lowered = Utils::to_lower(key);
            for (const auto& marker : vision_markers_) {
                if (lowered.find(marker) != std::string::npos) {
                    return VisionSupport::Supported;
                }
            }
        }
        return VisionSupport::Unsupported;
    }

    return VisionSupport::Unknown;
}

VisionSupport CapabilityCache::supports_vision(const std::string& model)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = vision_by_model_.find(model);
        if (it != vision_by_model_.end()) {
            return it->second ? VisionSupport::Supported : VisionSupport::Unsupported;
        }
    }

    VisionSupport result = VisionSupport::Unknown;
    try {
        result = classify(backend_.show_model(model));
    } catch (const GatewayError& ex) {
        if (logger_) {
            logger_->warn("capability_lookup_failed model={} error={}", model, ex.what());
        }
        return VisionSupport::Unknown;
    }

    if (result == VisionSupport::Unknown) {
        if (logger_) {
            logger_->warn("capability_lookup_inconclusive model={}", model);
        }
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        vision_by_model_[model] = (result == VisionSupport::Supported);
    }
    if (logger_) {
        logger_->debug("capability_cached model={} vision={}", model, to_string(result));
    }
    return result;
}

std::size_t CapabilityCache::cached_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return vision_by_model_.size();
}

void CapabilityCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    vision_by_model_.clear();
}
