#pragma once
#include "FallbackDetector.hpp"
#include "IModelBackend.hpp"
#include "MessageComposer.hpp"
#include "Types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class EndpointRouter;
class RequestExecutor;
namespace spdlog { class logger; }

/**
 * @brief Wire-level client for an Ollama-compatible backend.
 *
 * Every network operation throws exactly one of GatewayTimeoutError,
 * GatewayConnectionError or BackendError; list_models() and check_health()
 * report failures through their result structs instead.
 */
class OllamaClient : public IModelBackend {
public:
    using PullProgressCallback = std::function<void(const PullProgress&)>;

    OllamaClient(RequestExecutor& executor,
                 const EndpointRouter& router,
                 FallbackDetector fallback_detector = FallbackDetector());

    ListModelsResult list_models() override;
    Json::Value show_model(const std::string& model) override;

    ModelDetails describe_model(const std::string& model);
    HealthResult check_health();

    GenerationResult generate(const GenerationRequest& request);
    GenerationResult chat(const GenerationRequest& request);

    /**
     * @brief Sends images through /api/chat, retrying once through /api/generate
     *        when the reply claims no image arrived or the chat call is rejected
     *        with a fallback status.
     */
    GenerationResult chat_with_image(const GenerationRequest& request);

    /**
     * @brief Streams /api/pull until the backend reports completion.
     * @param cancel_requested Checked before each progress record; may be nullptr.
     * @throws OperationCancelledError when cancel_requested becomes true mid-transfer.
     */
    void pull_model(const std::string& model,
                    const PullProgressCallback& on_progress,
                    const std::atomic<bool>* cancel_requested = nullptr);

    void delete_model(const std::string& model);

    bool can_use_cloud_model(const std::string& model) const;

    bool web_search_available() const;
    std::vector<WebSearchResult> web_search(const std::string& query, int max_results = 5);


private:
    void ensure_routable(const std::string& model) const;
    std::string endpoint_url(const std::string& model, const std::string& path) const;

    RequestExecutor& executor_;
    const EndpointRouter& router_;
    FallbackDetector fallback_detector_;
    std::shared_ptr<spdlog::logger> logger_;
};
