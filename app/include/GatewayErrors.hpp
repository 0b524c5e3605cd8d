#ifndef GATEWAY_ERRORS_HPP
#define GATEWAY_ERRORS_HPP

#include <stdexcept>
#include <string>

class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message)
        : std::runtime_error(message) {}
};

class GatewayTimeoutError : public GatewayError {
public:
    explicit GatewayTimeoutError(const std::string& message)
        : GatewayError(message) {}
};

class GatewayConnectionError : public GatewayError {
public:
    explicit GatewayConnectionError(const std::string& message)
        : GatewayError(message) {}
};

/**
 * @brief Non-2xx response (or a 2xx response without usable content).
 */
class BackendError : public GatewayError {
public:
    BackendError(int status, std::string detail)
        : GatewayError(format_message(status, detail)),
          status_(status),
          detail_(std::move(detail)) {}

    int status() const { return status_; }
    const std::string& detail() const { return detail_; }

protected:
    BackendError(int status, std::string detail, const std::string& message)
        : GatewayError(message),
          status_(status),
          detail_(std::move(detail)) {}

private:
    static std::string format_message(int status, const std::string& detail) {
        std::string message = "Ollama returned HTTP " + std::to_string(status);
        if (!detail.empty()) {
            message += ": " + detail;
        }
        return message;
    }

    int status_{0};
    std::string detail_;
};

class EmptyResponseError : public BackendError {
public:
    explicit EmptyResponseError(int status)
        : BackendError(status, "", "Empty response from Ollama") {}
};

class OperationCancelledError : public GatewayError {
public:
    explicit OperationCancelledError(const std::string& message)
        : GatewayError(message) {}
};

#endif // GATEWAY_ERRORS_HPP
