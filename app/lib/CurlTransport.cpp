#include "CurlTransport.hpp"
#include "Logger.hpp"
#include <curl/curl.h>

namespace {

struct WriteContext {
    CURL* curl{nullptr};
    std::string* response{nullptr};
    const ITransport::ChunkHandler* on_chunk{nullptr};
    bool aborted{false};
};

size_t write_callback(void* contents, size_t size, size_t nmemb, WriteContext* context) {
    size_t total = size * nmemb;
    const char* data = static_cast<const char*>(contents);
    long http_code = 0;
    curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &http_code);
    // Error bodies are collected whole so the caller can report them.
    if (context->on_chunk && *context->on_chunk && http_code < 300) {
        if (!(*context->on_chunk)(std::string_view(data, total))) {
            context->aborted = true;
            return 0;
        }
        return total;
    }
    context->response->append(data, total);
    return total;
}

TransportStatus classify(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportStatus::Timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportStatus::Aborted;
        default:
            return TransportStatus::ConnectionFailed;
    }
}

void apply_method(CURL* curl, const HttpRequest& request) {
    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
        case HttpMethod::Delete:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
    }
}

}

CurlTransport::CurlTransport()
{
    logger_ = Logger::get_logger("net_logger");
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    return run(request, nullptr);
}

HttpResponse CurlTransport::perform_streaming(const HttpRequest& request,
                                              const ChunkHandler& on_chunk) {
    return run(request, &on_chunk);
}

HttpResponse CurlTransport::run(const HttpRequest& request, const ChunkHandler* on_chunk) {
    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        if (logger_) {
            logger_->error("Failed to initialize cURL for {}", request.url);
        }
        result.status = TransportStatus::ConnectionFailed;
        result.error = "Failed to initialize cURL";
        return result;
    }

    WriteContext context{curl, &result.body, on_chunk, false};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    apply_method(curl, request);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.timeout_seconds));
    if (on_chunk) {
        // Pulls can run for a long time; only give up when the stream stalls.
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.timeout_seconds));
    } else {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        headers = curl_slist_append(headers, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    if (logger_) {
        logger_->debug("{} {} body_bytes={}", to_string(request.method), request.url, request.body.size());
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        result.status = context.aborted ? TransportStatus::Aborted : classify(res);
        result.error = curl_easy_strerror(res);
        if (logger_ && result.status != TransportStatus::Aborted) {
            logger_->warn("Request to {} failed: {}", request.url, result.error);
        }
        curl_easy_cleanup(curl);
        return result;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.http_code);
    curl_easy_cleanup(curl);
    result.status = TransportStatus::Ok;

    if (logger_) {
        logger_->debug("{} {} returned HTTP {}", to_string(request.method), request.url, result.http_code);
    }

    return result;
}
