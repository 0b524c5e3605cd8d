#include "EndpointRouter.hpp"
#include "Utils.hpp"

EndpointRouter::EndpointRouter(std::string local_base_url,
                               std::string remote_base_url,
                               std::optional<std::string> api_key,
                               std::string auth_scheme)
    : local_base_url_(Utils::strip_trailing_slashes(std::move(local_base_url))),
      remote_base_url_(Utils::strip_trailing_slashes(std::move(remote_base_url))),
      api_key_(std::move(api_key)),
      auth_scheme_(std::move(auth_scheme))
{
    if (api_key_ && Utils::trim(*api_key_).empty()) {
        api_key_.reset();
    }
}

bool EndpointRouter::is_cloud_model(const std::string& model) {
    return model.ends_with(kCloudSuffix);
}

bool EndpointRouter::has_credential() const {
    return api_key_.has_value();
}

bool EndpointRouter::is_routable(const std::string& model) const {
    if (model.empty()) {
        return false;
    }
    return !is_cloud_model(model) || has_credential();
}

std::string EndpointRouter::base_url_for(const std::string& model) const {
    if (is_cloud_model(model) && has_credential()) {
        return remote_base_url_;
    }
    return local_base_url_;
}

EndpointRouter::Headers EndpointRouter::auth_headers_for(const std::string& model) const {
    if (is_cloud_model(model)) {
        return remote_auth_headers();
    }
    return {};
}

EndpointRouter::Headers EndpointRouter::remote_auth_headers() const {
    if (!has_credential()) {
        return {};
    }
    return {{"Authorization", auth_scheme_ + " " + *api_key_}};
}
