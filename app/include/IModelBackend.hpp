#pragma once
#include "ProviderTypes.hpp"
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <string>

/**
 * @brief The slice of the inference backend that model selection depends on.
 */
class IModelBackend {
public:
    virtual ~IModelBackend() = default;

    /// Local inventory; failures are reported through the result, never thrown.
    virtual ListModelsResult list_models() = 0;

    /// Raw /api/show document. Throws GatewayError subclasses on failure.
    virtual Json::Value show_model(const std::string& model) = 0;
};
