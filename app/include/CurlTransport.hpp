#pragma once
#include "HttpTransport.hpp"
#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief libcurl-backed transport; every call uses its own easy handle.
 */
class CurlTransport : public ITransport {
public:
    CurlTransport();

    HttpResponse perform(const HttpRequest& request) override;
    HttpResponse perform_streaming(const HttpRequest& request,
                                   const ChunkHandler& on_chunk) override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    HttpResponse run(const HttpRequest& request, const ChunkHandler* on_chunk);
};
