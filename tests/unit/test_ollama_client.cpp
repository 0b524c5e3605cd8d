#include <catch2/catch.hpp>

#include "EndpointRouter.hpp"
#include "GatewayErrors.hpp"
#include "OllamaClient.hpp"
#include "RequestExecutor.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <vector>

namespace {

struct ClientFixture {
    explicit ClientFixture(std::optional<std::string> api_key = std::nullopt)
        : transport(std::make_shared<FakeTransport>()),
          executor(transport, 1),
          router("http://local:11434", "https://remote.example", std::move(api_key)),
          client(executor, router)
    {
        executor.set_sleeper([](std::chrono::milliseconds) {});
    }

    Json::Value last_body(const std::string& route) const {
        for (const auto& request : transport->requests()) {
            if (request.url.size() >= route.size()
                && request.url.compare(request.url.size() - route.size(), route.size(), route) == 0) {
                Json::Value root;
                Json::CharReaderBuilder builder;
                std::istringstream stream(request.body);
                std::string errors;
                Json::parseFromStream(builder, stream, &root, &errors);
                return root;
            }
        }
        return Json::Value();
    }

    std::shared_ptr<FakeTransport> transport;
    RequestExecutor executor;
    EndpointRouter router;
    OllamaClient client;
};

GenerationRequest image_request() {
    GenerationRequest request;
    request.model = "llava";
    request.prompt = "What is in this picture?";
    request.images = {"aW1hZ2U="};
    return request;
}

} // namespace

TEST_CASE("OllamaClient lists sorted unique model names") {
    ClientFixture fx;
    fx.transport->enqueue("/api/tags", http_ok(R"({"models":[{"name":"qwen-coder"},{"name":"llama3"},{"name":"llava"},{"name":"llama3"},{"size":1}]})"));

    const ListModelsResult result = fx.client.list_models();
    REQUIRE(result.ok);
    REQUIRE(result.models == std::vector<std::string>{"llama3", "llava", "qwen-coder"});
    REQUIRE(fx.transport->requests().front().url == "http://local:11434/api/tags");
}

TEST_CASE("OllamaClient reports listing failures through the result") {
    ClientFixture fx;
    fx.transport->enqueue("/api/tags", transport_failure(TransportStatus::ConnectionFailed, "refused"));

    const ListModelsResult result = fx.client.list_models();
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error_message.find("refused") != std::string::npos);
}

TEST_CASE("OllamaClient chat_with_image returns the chat reply when the image was seen") {
    ClientFixture fx;
    fx.transport->enqueue("/api/chat", http_ok(R"({"message":{"role":"assistant","content":" A red bicycle. "}})"));

    const GenerationResult result = fx.client.chat_with_image(image_request());
    REQUIRE(result.text == "A red bicycle.");
    REQUIRE(result.endpoint == GenerationEndpoint::Chat);
    REQUIRE_FALSE(result.fallback_used);
    REQUIRE(fx.transport->count("/api/generate") == 0);

    const Json::Value body = fx.last_body("/api/chat");
    REQUIRE(body["messages"][0]["images"][0].asString() == "aW1hZ2U=");
}

TEST_CASE("OllamaClient falls back to generate when the chat reply asks for an image") {
    ClientFixture fx;
    fx.transport->enqueue("/api/chat", http_ok(R"({"message":{"content":"Please attach an image so I can help."}})"));
    fx.transport->enqueue("/api/generate", http_ok(R"({"response":"A cat sleeping on a sofa."})"));

    const GenerationResult result = fx.client.chat_with_image(image_request());
    REQUIRE(result.text == "A cat sleeping on a sofa.");
    REQUIRE(result.endpoint == GenerationEndpoint::Generate);
    REQUIRE(result.fallback_used);
    REQUIRE(fx.transport->count("/api/chat") == 1);
    REQUIRE(fx.transport->count("/api/generate") == 1);
    REQUIRE(fx.last_body("/api/generate")["images"][0].asString() == "aW1hZ2U=");
}

TEST_CASE("OllamaClient falls back to generate on rejected chat statuses") {
    for (long status : {400L, 404L, 422L}) {
        ClientFixture fx;
        fx.transport->enqueue("/api/chat", http_status(status, "images not supported"));
        fx.transport->enqueue("/api/generate", http_ok(R"({"response":"Two dogs."})"));

        const GenerationResult result = fx.client.chat_with_image(image_request());
        REQUIRE(result.fallback_used);
        REQUIRE(result.text == "Two dogs.");
    }
}

TEST_CASE("OllamaClient does not fall back on server errors or timeouts") {
    SECTION("server error") {
        ClientFixture fx;
        fx.transport->enqueue("/api/chat", http_status(500, "boom"));
        REQUIRE_THROWS_AS(fx.client.chat_with_image(image_request()), BackendError);
        REQUIRE(fx.transport->count("/api/generate") == 0);
    }
    SECTION("timeout") {
        ClientFixture fx;
        fx.transport->enqueue("/api/chat", transport_failure(TransportStatus::Timeout));
        REQUIRE_THROWS_AS(fx.client.chat_with_image(image_request()), GatewayTimeoutError);
        REQUIRE(fx.transport->count("/api/generate") == 0);
    }
    SECTION("empty reply") {
        ClientFixture fx;
        fx.transport->enqueue("/api/chat", http_ok(R"({"message":{"content":""}})"));
        REQUIRE_THROWS_AS(fx.client.chat_with_image(image_request()), EmptyResponseError);
        REQUIRE(fx.transport->count("/api/generate") == 0);
    }
}

TEST_CASE("OllamaClient propagates fallback failures without a second hop") {
    ClientFixture fx;
    fx.transport->enqueue("/api/chat", http_status(400, "bad request"));
    fx.transport->enqueue("/api/generate", http_status(404, "model not found"));

    try {
        fx.client.chat_with_image(image_request());
        FAIL("expected BackendError");
    } catch (const BackendError& ex) {
        REQUIRE(ex.status() == 404);
    }
    REQUIRE(fx.transport->count("/api/chat") == 1);
    REQUIRE(fx.transport->count("/api/generate") == 1);
}

TEST_CASE("OllamaClient routes cloud models with credentials") {
    ClientFixture fx(std::string("secret"));
    fx.transport->enqueue("/api/generate", http_ok(R"({"response":"hi"})"));

    GenerationRequest request;
    request.model = "gpt-oss:120b-cloud";
    request.prompt = "hello";
    REQUIRE(fx.client.generate(request).text == "hi");

    const HttpRequest sent = fx.transport->requests().front();
    REQUIRE(sent.url == "https://remote.example/api/generate");
    REQUIRE(sent.headers.at("Authorization") == "Bearer secret");
    REQUIRE(fx.client.can_use_cloud_model("gpt-oss:120b-cloud"));
}

TEST_CASE("OllamaClient refuses cloud models without credentials") {
    ClientFixture fx;
    GenerationRequest request;
    request.model = "gpt-oss:120b-cloud";
    request.prompt = "hello";

    try {
        fx.client.chat(request);
        FAIL("expected BackendError");
    } catch (const BackendError& ex) {
        REQUIRE(ex.status() == 401);
    }
    REQUIRE(fx.transport->requests().empty());
    REQUIRE_FALSE(fx.client.can_use_cloud_model("gpt-oss:120b-cloud"));
}

TEST_CASE("OllamaClient describe_model reads details and the modelfile system line") {
    ClientFixture fx;
    fx.transport->enqueue("/api/show", http_ok(R"({
        "details": {"family": "llama", "parameter_size": "8.0B", "quantization_level": "Q4_0"},
        "capabilities": ["completion", "vision"],
        "modelfile": "FROM llava\nSYSTEM You describe pictures.\nPARAMETER temperature 0.1\n"
    })"));

    const ModelDetails details = fx.client.describe_model("llava");
    REQUIRE(details.family == "llama");
    REQUIRE(details.architecture == "llama");
    REQUIRE(details.display_name() == "llava (8.0B, Q4_0)");
    REQUIRE(details.capabilities == std::vector<std::string>{"completion", "vision"});
    REQUIRE(details.system_prompt == std::optional<std::string>("You describe pictures."));
}

TEST_CASE("OllamaClient pull_model streams NDJSON progress across chunk boundaries") {
    ClientFixture fx;
    fx.transport->enqueue_stream("/api/pull", {
        "{\"status\":\"pulling manifest\"}\n{\"status\":\"downloading\",\"digest\":\"sha\",\"total\":100,",
        "\"completed\":40}\n",
        "{\"status\":\"success\"}\n",
    });

    std::vector<PullProgress> updates;
    fx.client.pull_model("llava", [&](const PullProgress& progress) { updates.push_back(progress); });

    REQUIRE(updates.size() == 3);
    REQUIRE(updates[0].phase == "pulling manifest");
    REQUIRE_FALSE(updates[0].has_sizes());
    REQUIRE(updates[1].bytes_done == 40);
    REQUIRE(updates[1].bytes_total == 100);
    REQUIRE(updates[2].phase == "success");
    REQUIRE(fx.last_body("/api/pull")["stream"].asBool());
}

TEST_CASE("OllamaClient pull_model drops a partial record when the stream is retried") {
    ClientFixture fx;
    fx.transport->enqueue_broken_stream("/api/pull", {
        "{\"status\":\"downloading\",\"total\":100,\"completed\":10}\n{\"status\":\"down",
    });
    fx.transport->enqueue_stream("/api/pull", {
        "{\"status\":\"verifying sha256 digest\"}\n",
        "{\"status\":\"success\"}\n",
    });

    std::vector<std::string> phases;
    fx.client.pull_model("llava", [&](const PullProgress& progress) { phases.push_back(progress.phase); });

    REQUIRE(fx.transport->count("/api/pull") == 2);
    REQUIRE(phases == std::vector<std::string>{"downloading", "verifying sha256 digest", "success"});
}

TEST_CASE("OllamaClient pull_model raises BackendError for error records") {
    ClientFixture fx;
    fx.transport->enqueue_stream("/api/pull", {"{\"error\":\"pull model manifest: file does not exist\"}\n"});

    try {
        fx.client.pull_model("nope", {});
        FAIL("expected BackendError");
    } catch (const BackendError& ex) {
        REQUIRE(ex.detail() == "pull model manifest: file does not exist");
    }
}

TEST_CASE("OllamaClient pull_model stops when cancellation is requested") {
    ClientFixture fx;
    fx.transport->enqueue_stream("/api/pull", {
        "{\"status\":\"downloading\",\"total\":100,\"completed\":10}\n",
        "{\"status\":\"downloading\",\"total\":100,\"completed\":20}\n",
        "{\"status\":\"success\"}\n",
    });

    std::atomic<bool> cancel{false};
    int updates = 0;
    REQUIRE_THROWS_AS(fx.client.pull_model("llava",
                                           [&](const PullProgress&) {
                                               ++updates;
                                               cancel = true;
                                           },
                                           &cancel),
                      OperationCancelledError);
    REQUIRE(updates == 1);
}

TEST_CASE("OllamaClient delete_model sends DELETE with the model name") {
    ClientFixture fx;
    fx.transport->enqueue("/api/delete", http_ok(""));

    fx.client.delete_model("llava");
    const HttpRequest sent = fx.transport->requests().front();
    REQUIRE(sent.method == HttpMethod::Delete);
    REQUIRE(fx.last_body("/api/delete")["model"].asString() == "llava");
}

TEST_CASE("OllamaClient web_search requires a credential and parses results") {
    SECTION("without credential") {
        ClientFixture fx;
        REQUIRE_FALSE(fx.client.web_search_available());
        REQUIRE_THROWS_AS(fx.client.web_search("ollama"), BackendError);
    }
    SECTION("with credential") {
        ClientFixture fx(std::string("secret"));
        fx.transport->enqueue("/api/web_search", http_ok(R"({"results":[
            {"title":"Ollama","url":"https://ollama.com","content":"Get up and running."},
            {"title":"Docs","url":"https://docs.ollama.com"}]})"));

        const auto results = fx.client.web_search("ollama", 2);
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].title == "Ollama");
        REQUIRE(results[1].content.empty());
        REQUIRE(fx.last_body("/api/web_search")["max_results"].asInt() == 2);
        REQUIRE(fx.transport->requests().front().url == "https://remote.example/api/web_search");
    }
}

TEST_CASE("OllamaClient check_health maps failures to HealthResult") {
    SECTION("healthy") {
        ClientFixture fx;
        fx.transport->enqueue("/api/tags", http_ok(R"({"models":[]})"));
        REQUIRE(fx.client.check_health().ok);
    }
    SECTION("http error") {
        ClientFixture fx;
        fx.transport->enqueue("/api/tags", http_status(503));
        const HealthResult health = fx.client.check_health();
        REQUIRE_FALSE(health.ok);
        REQUIRE(health.http_code == 503);
    }
    SECTION("unreachable") {
        ClientFixture fx;
        const HealthResult health = fx.client.check_health();
        REQUIRE_FALSE(health.ok);
        REQUIRE(health.http_code == 0);
    }
}
