#ifndef REQUEST_EXECUTOR_HPP
#define REQUEST_EXECUTOR_HPP

#include "HttpTransport.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace Json { class Value; }
namespace spdlog { class logger; }

/**
 * @brief Runs one logical HTTP call with bounded retries and typed failures.
 *
 * Timeouts and connection failures are retried up to retries() times with an
 * exponential delay of backoff_base * 2^attempt. A completed exchange with a
 * non-2xx status is never retried and surfaces as BackendError.
 */
class RequestExecutor {
public:
    using Headers = std::map<std::string, std::string>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using TextExtractor = std::function<std::string(const Json::Value&)>;
    using AttemptStarted = std::function<void()>;

    static constexpr std::size_t kMaxErrorDetailChars = 300;

    RequestExecutor(std::shared_ptr<ITransport> transport,
                    int retries = 2,
                    std::chrono::milliseconds backoff_base = std::chrono::milliseconds(500),
                    int timeout_seconds = 60);

    /**
     * @brief Performs the call and returns the raw 2xx body.
     * @throws GatewayTimeoutError, GatewayConnectionError, BackendError
     */
    std::string execute(HttpMethod method,
                        const std::string& url,
                        const std::string& body,
                        const Headers& headers = {});

    /**
     * @brief Performs the call with a JSON payload and parses the JSON reply.
     * @param payload Request body; a null value sends no body.
     */
    Json::Value execute_json(HttpMethod method,
                             const std::string& url,
                             const Json::Value& payload,
                             const Headers& headers = {});

    /**
     * @brief Like execute_json() but extracts a text field and rejects blank text.
     * @throws EmptyResponseError when the extracted text is empty after trimming.
     */
    std::string execute_text(HttpMethod method,
                             const std::string& url,
                             const Json::Value& payload,
                             const TextExtractor& extract_text,
                             const Headers& headers = {});

    /**
     * @brief Streams the 2xx body through on_chunk.
     * @param on_attempt_start Called before every attempt, so the caller can drop
     *        partial state left by a transfer that failed mid-stream.
     * @throws OperationCancelledError when on_chunk aborts the transfer.
     */
    void execute_streaming(HttpMethod method,
                           const std::string& url,
                           const std::string& body,
                           const ITransport::ChunkHandler& on_chunk,
                           const Headers& headers = {},
                           const AttemptStarted& on_attempt_start = nullptr);

    std::chrono::milliseconds backoff_delay(int attempt) const;

    void set_sleeper(Sleeper sleeper);
    int retries() const { return retries_; }

private:
    using Attempt = std::function<HttpResponse(const HttpRequest&)>;

    HttpResponse run_with_retries(const HttpRequest& request, const Attempt& attempt);
    static std::string truncate_detail(const std::string& body);

    std::shared_ptr<ITransport> transport_;
    int retries_;
    std::chrono::milliseconds backoff_base_;
    int timeout_seconds_;
    Sleeper sleeper_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // REQUEST_EXECUTOR_HPP
