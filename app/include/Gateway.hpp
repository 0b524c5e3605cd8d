#ifndef GATEWAY_HPP
#define GATEWAY_HPP

#include "CapabilityCache.hpp"
#include "CatalogScraper.hpp"
#include "DownloadCoordinator.hpp"
#include "EndpointRouter.hpp"
#include "ModelInventory.hpp"
#include "ModelOrchestrator.hpp"
#include "OllamaClient.hpp"
#include "RequestExecutor.hpp"
#include "Types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

class Settings;
class ITransport;
namespace spdlog { class logger; }

struct GatewayReply {
    TaskType task{TaskType::General};
    OrchestrationDecision decision;
    /// Empty when the request carried images and no installed model can read them.
    std::optional<GenerationResult> generation;
};

/**
 * @brief Owns one transport and every cache and service built on it.
 */
class Gateway {
public:
    /// @param transport Defaults to a CurlTransport.
    explicit Gateway(const Settings& settings, std::shared_ptr<ITransport> transport = nullptr);

    /**
     * @brief Detects the task, selects a model and runs the generation.
     * @param images Base64 payloads for the live turn.
     */
    GatewayReply ask(const std::string& prompt,
                     const std::vector<std::string>& images = {},
                     const std::vector<ConversationTurn>& history = {},
                     const std::optional<std::string>& preferred_model = std::nullopt);

    OllamaClient& client() { return client_; }
    RequestExecutor& executor() { return executor_; }
    const EndpointRouter& router() const { return router_; }
    CapabilityCache& capabilities() { return capabilities_; }
    ModelInventory& inventory() { return inventory_; }
    ModelOrchestrator& orchestrator() { return orchestrator_; }
    CatalogScraper& catalog() { return catalog_; }
    DownloadCoordinator& downloads() { return downloads_; }

    const std::string& default_model() const { return default_model_; }

private:
    std::string default_model_;
    std::string keep_alive_;
    bool use_chat_api_;
    std::shared_ptr<ITransport> transport_;
    RequestExecutor executor_;
    EndpointRouter router_;
    OllamaClient client_;
    CapabilityCache capabilities_;
    ModelInventory inventory_;
    ModelOrchestrator orchestrator_;
    CatalogScraper catalog_;
    DownloadCoordinator downloads_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // GATEWAY_HPP
