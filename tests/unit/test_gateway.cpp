#include <catch2/catch.hpp>

#include "Gateway.hpp"
#include "IniConfig.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <memory>

namespace {

Settings make_settings(bool use_chat_api = true) {
    IniConfig config;
    config.set_value("ollama", "base_url", "http://local:11434");
    config.set_value("ollama", "default_model", "llama3");
    config.set_value("ollama", "use_chat_api", use_chat_api ? "true" : "false");
    config.set_value("ollama", "retries", "0");
    Settings settings;
    settings.apply_ini(config);
    settings.validate();
    return settings;
}

} // namespace

TEST_CASE("Gateway routes an image request to an installed vision model") {
    auto transport = std::make_shared<FakeTransport>();
    transport->enqueue("/api/tags", http_ok(R"({"models":[{"name":"llama3"},{"name":"llava-vision"}]})"));
    // The preferred llama3 is introspected first, then llava-vision.
    transport->enqueue("/api/show", http_ok(R"({"capabilities":["completion"]})"));
    transport->enqueue("/api/show", http_ok(R"({"capabilities":["completion","vision"]})"));
    transport->enqueue("/api/chat", http_ok(R"({"message":{"content":"A lighthouse at dusk."}})"));

    Gateway gateway(make_settings(), transport);
    const GatewayReply reply = gateway.ask("What is this?", {"aW1hZ2U="});

    REQUIRE(reply.task == TaskType::Vision);
    REQUIRE(reply.decision.selected_model == "llava-vision");
    REQUIRE(reply.decision.changed_from_preferred);
    REQUIRE(transport->count("/api/show") == 2);
    REQUIRE(reply.generation.has_value());
    REQUIRE(reply.generation->text == "A lighthouse at dusk.");
    REQUIRE(reply.generation->endpoint == GenerationEndpoint::Chat);
}

TEST_CASE("Gateway refuses image requests when no model can read images") {
    auto transport = std::make_shared<FakeTransport>();
    transport->enqueue("/api/tags", http_ok(R"({"models":[{"name":"llama3"}]})"));
    transport->enqueue("/api/show", http_ok(R"({"capabilities":["completion"]})"));

    Gateway gateway(make_settings(), transport);
    const GatewayReply reply = gateway.ask("What is this?", {"aW1hZ2U="});

    REQUIRE(reply.task == TaskType::Vision);
    REQUIRE_FALSE(reply.decision.suitable_model_found);
    REQUIRE_FALSE(reply.generation.has_value());
    REQUIRE(transport->count("/api/chat") == 0);
    REQUIRE(transport->count("/api/generate") == 0);
}

TEST_CASE("Gateway uses the generate endpoint when the chat API is disabled") {
    auto transport = std::make_shared<FakeTransport>();
    transport->enqueue("/api/generate", http_ok(R"({"response":"Rome was founded in 753 BC."})"));

    Gateway gateway(make_settings(false), transport);
    const GatewayReply reply = gateway.ask("When was Rome founded?");

    REQUIRE(reply.task == TaskType::General);
    REQUIRE(reply.decision.selected_model == "llama3");
    REQUIRE(reply.generation->endpoint == GenerationEndpoint::Generate);
    REQUIRE(transport->count("/api/tags") == 0);
}

TEST_CASE("Gateway sends code questions to an installed code model") {
    auto transport = std::make_shared<FakeTransport>();
    transport->enqueue("/api/tags", http_ok(R"({"models":[{"name":"llama3"},{"name":"qwen-coder"}]})"));
    transport->enqueue("/api/chat", http_ok(R"({"message":{"content":"Use a dict comprehension."}})"));

    Gateway gateway(make_settings(), transport);
    const GatewayReply reply = gateway.ask("How do I invert a dict in python?");

    REQUIRE(reply.task == TaskType::Code);
    REQUIRE(reply.decision.selected_model == "qwen-coder");
    REQUIRE(reply.decision.changed_from_preferred);
    REQUIRE(reply.generation->model == "qwen-coder");
}

TEST_CASE("Gateway keeps a local model for code questions when cloud models need a key") {
    auto transport = std::make_shared<FakeTransport>();
    transport->enqueue("/api/tags", http_ok(R"({"models":[{"name":"llama3"},{"name":"qwen3-coder:480b-cloud"}]})"));
    transport->enqueue("/api/chat", http_ok(R"({"message":{"content":"Return early on empty input."}})"));

    Gateway gateway(make_settings(), transport);
    const GatewayReply reply = gateway.ask("fix this python function");

    REQUIRE(reply.task == TaskType::Code);
    REQUIRE(reply.decision.selected_model == "llama3");
    REQUIRE_FALSE(reply.decision.changed_from_preferred);
    REQUIRE(reply.generation.has_value());
    REQUIRE(reply.generation->model == "llama3");
    for (const auto& request : transport->requests()) {
        REQUIRE(request.url.rfind("http://local:11434/", 0) == 0);
    }
}
