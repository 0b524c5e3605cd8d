#include "OllamaClient.hpp"
#include "EndpointRouter.hpp"
#include "GatewayErrors.hpp"
#include "Logger.hpp"
#include "RequestExecutor.hpp"
#include "Utils.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <set>
#include <sstream>

namespace {

constexpr std::size_t kMaxSystemPromptChars = 200;

std::string string_field(const Json::Value& object, const char* key) {
    if (!object.isObject()) {
        return {};
    }
    const Json::Value& value = object[key];
    return value.isString() ? value.asString() : std::string();
}

std::uint64_t uint_field(const Json::Value& object, const char* key) {
    if (!object.isObject()) {
        return 0;
    }
    const Json::Value& value = object[key];
    return value.isUInt64() ? value.asUInt64() : 0;
}

std::string to_json_body(const Json::Value& payload) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, payload);
}

std::string extract_generate_text(const Json::Value& root) {
    return string_field(root, "response");
}

std::string extract_chat_text(const Json::Value& root) {
    if (!root.isObject()) {
        return {};
    }
    return string_field(root["message"], "content");
}

std::optional<std::string> first_system_line(const std::string& modelfile) {
    std::istringstream stream(modelfile);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.size() >= 7 && Utils::to_lower(line.substr(0, 7)) == "system ") {
            std::string prompt = Utils::trim(line.substr(7));
            if (prompt.size() > kMaxSystemPromptChars) {
                prompt.resize(kMaxSystemPromptChars);
            }
            return prompt;
        }
    }
    return std::nullopt;
}

}

OllamaClient::OllamaClient(RequestExecutor& executor,
                           const EndpointRouter& router,
                           FallbackDetector fallback_detector)
    : executor_(executor),
      router_(router),
      fallback_detector_(std::move(fallback_detector))
{
    logger_ = Logger::get_logger("core_logger");
}

void OllamaClient::ensure_routable(const std::string& model) const {
    if (!router_.is_routable(model)) {
        throw BackendError(401, "Model " + model + " requires OLLAMA_API_KEY for the cloud endpoint");
    }
}

std::string OllamaClient::endpoint_url(const std::string& model, const std::string& path) const {
    return router_.base_url_for(model) + path;
}

bool OllamaClient::can_use_cloud_model(const std::string& model) const {
    return EndpointRouter::is_cloud_model(model) && router_.has_credential();
}

ListModelsResult OllamaClient::list_models() {
    Json::Value root;
    try {
        root = executor_.execute_json(HttpMethod::Get, router_.local_base_url() + "/api/tags", Json::Value());
    } catch (const GatewayError& ex) {
        if (logger_) {
            logger_->warn("list_models_failed error={}", ex.what());
        }
        return ListModelsResult::error(ex.what());
    }

    const Json::Value& models_arr = root.isObject() ? root["models"] : Json::Value::nullSingleton();
    if (!models_arr.isArray()) {
        if (logger_) {
            logger_->warn("Ollama tags response missing 'models' array");
        }
        return ListModelsResult::error("Ollama tags response missing 'models' array");
    }

    std::set<std::string> unique_names;
    for (const auto& item : models_arr) {
        std::string name = string_field(item, "name");
        if (!name.empty()) {
            unique_names.insert(std::move(name));
        }
    }

    if (logger_) {
        logger_->debug("Parsed {} models from local Ollama", unique_names.size());
    }
    return ListModelsResult::success(std::vector<std::string>(unique_names.begin(), unique_names.end()));
}

HealthResult OllamaClient::check_health() {
    try {
        executor_.execute(HttpMethod::Get, router_.local_base_url() + "/api/tags", "");
        return HealthResult::success();
    } catch (const BackendError& ex) {
        return HealthResult::error("Ollama returned HTTP " + std::to_string(ex.status()), ex.status());
    } catch (const GatewayError& ex) {
        return HealthResult::error("Connection failed - is Ollama running at " + router_.local_base_url() + "? (" + ex.what() + ")", 0);
    }
}

Json::Value OllamaClient::show_model(const std::string& model) {
    ensure_routable(model);
    Json::Value payload;
    payload["model"] = model;
    return executor_.execute_json(HttpMethod::Post, endpoint_url(model, "/api/show"), payload,
                                  router_.auth_headers_for(model));
}

ModelDetails OllamaClient::describe_model(const std::string& model) {
    const Json::Value data = show_model(model);

    ModelDetails info;
    info.name = model;
    if (!data.isObject()) {
        return info;
    }

    const Json::Value& details = data["details"];
    info.family = string_field(details, "family");
    info.parameter_size = string_field(details, "parameter_size");
    info.quantization_level = string_field(details, "quantization_level");
    info.architecture = string_field(details, "architecture");
    if (info.architecture.empty()) {
        info.architecture = info.family;
    }
    info.size_bytes = uint_field(data, "size");
    info.system_prompt = first_system_line(string_field(data, "modelfile"));

    const Json::Value& capabilities = data["capabilities"];
    if (capabilities.isArray()) {
        for (const auto& capability : capabilities) {
            if (capability.isString()) {
                info.capabilities.push_back(capability.asString());
            }
        }
    }
    return info;
}

GenerationResult OllamaClient::generate(const GenerationRequest& request) {
    ensure_routable(request.model);
    if (logger_) {
        logger_->info("generate model={} prompt_chars={} history={} images={}",
                      request.model, request.prompt.size(), request.history.size(), request.images.size());
    }

    GenerationResult result;
    result.model = request.model;
    result.endpoint = GenerationEndpoint::Generate;
    result.text = executor_.execute_text(HttpMethod::Post,
                                         endpoint_url(request.model, "/api/generate"),
                                         MessageComposer::build_generate_payload(request),
                                         extract_generate_text,
                                         router_.auth_headers_for(request.model));
    return result;
}

GenerationResult OllamaClient::chat(const GenerationRequest& request) {
    ensure_routable(request.model);
    if (logger_) {
        logger_->info("chat model={} prompt_chars={} history={} images={}",
                      request.model, request.prompt.size(), request.history.size(), request.images.size());
    }

    GenerationResult result;
    result.model = request.model;
    result.endpoint = GenerationEndpoint::Chat;
    result.text = executor_.execute_text(HttpMethod::Post,
                                         endpoint_url(request.model, "/api/chat"),
                                         MessageComposer::build_chat_payload(request),
                                         extract_chat_text,
                                         router_.auth_headers_for(request.model));
    return result;
}

GenerationResult OllamaClient::chat_with_image(const GenerationRequest& request) {
    if (request.images.empty()) {
        return chat(request);
    }

    // Primary attempt: /api/chat. Only BackendError can earn a fallback hop;
    // timeouts and connection failures propagate untouched.
    std::optional<GenerationResult> primary;
    std::exception_ptr primary_error;
    ChatAttemptOutcome outcome;
    try {
        primary = chat(request);
        outcome = ChatAttemptOutcome::succeeded(primary->text);
    } catch (const BackendError& ex) {
        outcome = ChatAttemptOutcome::failed(ex.status());
        primary_error = std::current_exception();
    }

    const FallbackReason reason = fallback_detector_.evaluate(outcome);
    if (reason == FallbackReason::None) {
        if (primary_error) {
            std::rethrow_exception(primary_error);
        }
        return *primary;
    }

    if (logger_) {
        logger_->warn("chat_image_fallback model={} reason={} images={}",
                      request.model, to_string(reason), request.images.size());
    }

    // Fallback hop: /api/generate, at most once; its failures propagate.
    GenerationResult fallback = generate(request);
    fallback.fallback_used = true;
    return fallback;
}

void OllamaClient::pull_model(const std::string& model,
                              const PullProgressCallback& on_progress,
                              const std::atomic<bool>* cancel_requested) {
    ensure_routable(model);

    Json::Value payload;
    payload["model"] = model;
    payload["stream"] = true;

    std::string pending;
    std::string backend_error;
    std::exception_ptr callback_error;

    auto handle_line = [&](const std::string& line) -> bool {
        const std::string trimmed = Utils::trim(line);
        if (trimmed.empty()) {
            return true;
        }

        Json::CharReaderBuilder builder;
        Json::Value record;
        std::istringstream stream(trimmed);
        std::string errors;
        if (!Json::parseFromStream(builder, stream, &record, &errors) || !record.isObject()) {
            if (logger_) {
                logger_->debug("pull_model skipping unparsable record model={} error={}", model, errors);
            }
            return true;
        }

        if (record.isMember("error")) {
            backend_error = string_field(record, "error");
            return true;
        }

        PullProgress progress;
        progress.phase = string_field(record, "status");
        progress.bytes_total = uint_field(record, "total");
        progress.bytes_done = uint_field(record, "completed");
        if (on_progress) {
            try {
                on_progress(progress);
            } catch (...) {
                // Must not unwind through libcurl; rethrown after the transfer stops.
                callback_error = std::current_exception();
                return false;
            }
        }
        return true;
    };

    auto on_chunk = [&](std::string_view chunk) -> bool {
        if (cancel_requested && cancel_requested->load()) {
            return false;
        }
        pending.append(chunk.data(), chunk.size());
        std::size_t newline = pending.find('\n');
        while (newline != std::string::npos) {
            const std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!handle_line(line)) {
                return false;
            }
            if (cancel_requested && cancel_requested->load()) {
                return false;
            }
            newline = pending.find('\n');
        }
        return true;
    };

    if (logger_) {
        logger_->info("pull_model_started model={}", model);
    }

    try {
        // A retried attempt restarts the stream; bytes from the failed one are stale.
        executor_.execute_streaming(HttpMethod::Post, endpoint_url(model, "/api/pull"),
                                    to_json_body(payload), on_chunk, router_.auth_headers_for(model),
                                    [&pending, &backend_error]() {
                                        pending.clear();
                                        backend_error.clear();
                                    });
    } catch (const OperationCancelledError&) {
        if (callback_error) {
            std::rethrow_exception(callback_error);
        }
        if (logger_) {
            logger_->info("pull_model_cancelled model={}", model);
        }
        throw;
    }

    if (!pending.empty() && !handle_line(pending) && callback_error) {
        std::rethrow_exception(callback_error);
    }

    if (!backend_error.empty()) {
        if (logger_) {
            logger_->error("pull_model_failed model={} error={}", model, backend_error);
        }
        throw BackendError(200, backend_error);
    }

    if (logger_) {
        logger_->info("pull_model_finished model={}", model);
    }
}

void OllamaClient::delete_model(const std::string& model) {
    ensure_routable(model);
    Json::Value payload;
    payload["model"] = model;
    executor_.execute(HttpMethod::Delete, endpoint_url(model, "/api/delete"), to_json_body(payload),
                      router_.auth_headers_for(model));
    if (logger_) {
        logger_->info("delete_model model={}", model);
    }
}

bool OllamaClient::web_search_available() const {
    return router_.has_credential();
}

std::vector<WebSearchResult> OllamaClient::web_search(const std::string& query, int max_results) {
    if (!web_search_available()) {
        throw BackendError(401, "Web search requires OLLAMA_API_KEY");
    }

    Json::Value payload;
    payload["query"] = query;
    payload["max_results"] = max_results;
    const Json::Value root = executor_.execute_json(HttpMethod::Post,
                                                    router_.remote_base_url() + "/api/web_search",
                                                    payload,
                                                    router_.remote_auth_headers());

    std::vector<WebSearchResult> results;
    const Json::Value& items = root.isObject() ? root["results"] : Json::Value::nullSingleton();
    if (!items.isArray()) {
        return results;
    }
    for (const auto& item : items) {
        WebSearchResult result;
        result.title = string_field(item, "title");
        result.url = string_field(item, "url");
        result.content = string_field(item, "content");
        results.push_back(std::move(result));
    }
    return results;
}
