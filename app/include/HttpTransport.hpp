#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

enum class HttpMethod {Get, Post, Delete};

inline const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Delete: return "DELETE";
        default: return "GET";
    }
}

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
    int timeout_seconds{60};
};

enum class TransportStatus {Ok, Timeout, ConnectionFailed, Aborted};

/**
 * @brief Outcome of one transfer. http_code is only meaningful when status is Ok.
 */
struct HttpResponse {
    TransportStatus status{TransportStatus::ConnectionFailed};
    long http_code{0};
    std::string body;
    std::string error;

    bool ok() const {
        return status == TransportStatus::Ok && http_code >= 200 && http_code < 300;
    }
};

class ITransport {
public:
    /// Receives body bytes as they arrive; returning false aborts the transfer.
    using ChunkHandler = std::function<bool(std::string_view chunk)>;

    virtual ~ITransport() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;

    virtual HttpResponse perform_streaming(const HttpRequest& request,
                                           const ChunkHandler& on_chunk) = 0;
};
