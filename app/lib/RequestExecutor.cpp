#include "RequestExecutor.hpp"
#include "GatewayErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <spdlog/spdlog.h>
#include <sstream>
#include <thread>

namespace {

std::string to_json_body(const Json::Value& payload) {
    if (payload.isNull()) {
        return {};
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, payload);
}

}

RequestExecutor::RequestExecutor(std::shared_ptr<ITransport> transport,
                                 int retries,
                                 std::chrono::milliseconds backoff_base,
                                 int timeout_seconds)
    : transport_(std::move(transport)),
      retries_(retries < 0 ? 0 : retries),
      backoff_base_(backoff_base),
      timeout_seconds_(timeout_seconds),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
{
    logger_ = Logger::get_logger("net_logger");
}

void RequestExecutor::set_sleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

std::chrono::milliseconds RequestExecutor::backoff_delay(int attempt) const {
    if (attempt < 0) {
        attempt = 0;
    }
    // Cap the shift so very large retry counts cannot overflow.
    const int exponent = attempt > 20 ? 20 : attempt;
    return backoff_base_ * (1LL << exponent);
}

std::string RequestExecutor::truncate_detail(const std::string& body) {
    std::string detail = Utils::trim(body);
    if (detail.size() > kMaxErrorDetailChars) {
        detail.resize(kMaxErrorDetailChars);
    }
    return detail;
}

HttpResponse RequestExecutor::run_with_retries(const HttpRequest& request, const Attempt& attempt) {
    HttpResponse response;
    for (int i = 0; i <= retries_; ++i) {
        response = attempt(request);

        if (response.status == TransportStatus::Ok) {
            if (response.http_code < 200 || response.http_code >= 300) {
                if (logger_) {
                    logger_->warn("request_failed method={} url={} status={}",
                                  to_string(request.method), request.url, response.http_code);
                }
                throw BackendError(static_cast<int>(response.http_code), truncate_detail(response.body));
            }
            return response;
        }

        if (response.status == TransportStatus::Aborted) {
            throw OperationCancelledError("Request to " + request.url + " was cancelled");
        }

        if (i < retries_) {
            const auto delay = backoff_delay(i);
            if (logger_) {
                logger_->warn("request_retry method={} url={} attempt={} delay_ms={} error={}",
                              to_string(request.method), request.url, i + 1, delay.count(), response.error);
            }
            sleeper_(delay);
        }
    }

    if (logger_) {
        logger_->error("request_exhausted method={} url={} attempts={} error={}",
                       to_string(request.method), request.url, retries_ + 1, response.error);
    }
    if (response.status == TransportStatus::Timeout) {
        throw GatewayTimeoutError("Ollama request timed out: " + response.error);
    }
    throw GatewayConnectionError("Could not reach Ollama: " + response.error);
}

std::string RequestExecutor::execute(HttpMethod method,
                                     const std::string& url,
                                     const std::string& body,
                                     const Headers& headers) {
    HttpRequest request{method, url, body, headers, timeout_seconds_};
    HttpResponse response = run_with_retries(request, [this](const HttpRequest& req) {
        return transport_->perform(req);
    });
    return std::move(response.body);
}

Json::Value RequestExecutor::execute_json(HttpMethod method,
                                          const std::string& url,
                                          const Json::Value& payload,
                                          const Headers& headers) {
    HttpRequest request{method, url, to_json_body(payload), headers, timeout_seconds_};
    HttpResponse response = run_with_retries(request, [this](const HttpRequest& req) {
        return transport_->perform(req);
    });

    Json::Value root;
    if (Utils::trim(response.body).empty()) {
        return root;
    }

    Json::CharReaderBuilder builder;
    std::istringstream stream(response.body);
    std::string errors;
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        if (logger_) {
            logger_->warn("Failed to parse JSON from {}: {}", url, errors);
        }
        throw BackendError(static_cast<int>(response.http_code),
                           "Invalid JSON response: " + truncate_detail(response.body));
    }
    return root;
}

std::string RequestExecutor::execute_text(HttpMethod method,
                                          const std::string& url,
                                          const Json::Value& payload,
                                          const TextExtractor& extract_text,
                                          const Headers& headers) {
    const Json::Value root = execute_json(method, url, payload, headers);
    std::string text = Utils::trim(extract_text(root));
    if (text.empty()) {
        throw EmptyResponseError(200);
    }
    return text;
}

void RequestExecutor::execute_streaming(HttpMethod method,
                                        const std::string& url,
                                        const std::string& body,
                                        const ITransport::ChunkHandler& on_chunk,
                                        const Headers& headers,
                                        const AttemptStarted& on_attempt_start) {
    HttpRequest request{method, url, body, headers, timeout_seconds_};
    run_with_retries(request, [this, &on_chunk, &on_attempt_start](const HttpRequest& req) {
        if (on_attempt_start) {
            on_attempt_start();
        }
        return transport_->perform_streaming(req, on_chunk);
    });
}
