#pragma once
#include <map>
#include <optional>
#include <string>

/**
 * @brief Chooses base URL and Authorization header for a model name.
 *
 * Models named "<something>-cloud" live on the authenticated remote endpoint;
 * everything else goes to the local server.
 */
class EndpointRouter {
public:
    using Headers = std::map<std::string, std::string>;

    static constexpr const char* kCloudSuffix = "-cloud";

    EndpointRouter(std::string local_base_url,
                   std::string remote_base_url,
                   std::optional<std::string> api_key = std::nullopt,
                   std::string auth_scheme = "Bearer");

    static bool is_cloud_model(const std::string& model);

    bool has_credential() const;

    /// False for cloud models when no credential is configured.
    bool is_routable(const std::string& model) const;

    std::string base_url_for(const std::string& model) const;
    Headers auth_headers_for(const std::string& model) const;

    /// Headers for endpoints that only exist remotely (e.g. web search).
    Headers remote_auth_headers() const;

    const std::string& local_base_url() const { return local_base_url_; }
    const std::string& remote_base_url() const { return remote_base_url_; }

private:
    std::string local_base_url_;
    std::string remote_base_url_;
    std::optional<std::string> api_key_;
    std::string auth_scheme_;
};
