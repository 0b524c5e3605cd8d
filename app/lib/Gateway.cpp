#include "Gateway.hpp"
#include "CurlTransport.hpp"
#include "Logger.hpp"
#include "MessageComposer.hpp"
#include "Settings.hpp"

#include <spdlog/spdlog.h>

namespace {

std::shared_ptr<ITransport> transport_or_default(std::shared_ptr<ITransport> transport)
{
    if (transport) {
        return transport;
    }
    return std::make_shared<CurlTransport>();
}

}

Gateway::Gateway(const Settings& settings, std::shared_ptr<ITransport> transport)
    : default_model_(settings.get_default_model()),
      keep_alive_(settings.get_keep_alive()),
      use_chat_api_(settings.get_use_chat_api()),
      transport_(transport_or_default(std::move(transport))),
      executor_(transport_, settings.get_retries(), std::chrono::milliseconds(500),
                settings.get_request_timeout_seconds()),
      router_(settings.get_base_url(), settings.get_cloud_url(), settings.get_api_key(),
              settings.get_auth_scheme()),
      client_(executor_, router_),
      capabilities_(client_),
      inventory_(client_),
      orchestrator_(inventory_, capabilities_, router_),
      catalog_(executor_, settings.get_catalog_url()),
      downloads_([this](const std::string& model,
                        const DownloadCoordinator::ProgressSink& on_progress,
                        const std::atomic<bool>* cancel_requested) {
          client_.pull_model(model, on_progress, cancel_requested);
          inventory_.invalidate();
      })
{
    logger_ = Logger::get_logger("core_logger");
}

GatewayReply Gateway::ask(const std::string& prompt,
                          const std::vector<std::string>& images,
                          const std::vector<ConversationTurn>& history,
                          const std::optional<std::string>& preferred_model)
{
    const std::string preferred = preferred_model.value_or(default_model_);

    GatewayReply reply;
    reply.task = orchestrator_.detect_task(prompt, !images.empty());
    reply.decision = orchestrator_.select_model(reply.task, preferred);

    if (reply.task == TaskType::Vision && !reply.decision.suitable_model_found) {
        if (logger_) {
            logger_->warn("ask_rejected task=vision reason=no_vision_model preferred={}", preferred);
        }
        return reply;
    }

    GenerationRequest request;
    request.model = reply.decision.selected_model;
    request.prompt = prompt;
    request.history = history;
    request.images = images;
    request.keep_alive = keep_alive_;

    if (!images.empty()) {
        reply.generation = client_.chat_with_image(request);
    } else if (use_chat_api_) {
        reply.generation = client_.chat(request);
    } else {
        reply.generation = client_.generate(request);
    }
    return reply;
}
