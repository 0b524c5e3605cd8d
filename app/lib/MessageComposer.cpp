#include "MessageComposer.hpp"
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <sstream>
#include <stdexcept>

namespace {

Json::Value to_json_array(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

Json::Value parse_options(const std::string& raw) {
    Json::CharReaderBuilder builder;
    Json::Value options;
    std::istringstream stream(raw);
    std::string errors;
    if (!Json::parseFromStream(builder, stream, &options, &errors) || !options.isObject()) {
        throw std::invalid_argument("Generation options must be a JSON object: " + errors);
    }
    return options;
}

}

std::string MessageComposer::role_label(const std::string& role)
{
    if (role == "system") return "System";
    if (role == "user") return "User";
    if (role == "assistant") return "Assistant";
    if (role == "tool") return "Tool";
    return {};
}

std::optional<std::size_t> MessageComposer::find_last_system_turn(const std::vector<ConversationTurn>& history)
{
    for (std::size_t i = history.size(); i > 0; --i) {
        if (history[i - 1].role == "system") {
            return i - 1;
        }
    }
    return std::nullopt;
}

std::string MessageComposer::compose_prompt(const std::vector<ConversationTurn>& history,
                                            const std::string& prompt,
                                            std::optional<std::size_t> skip_index)
{
    std::vector<std::string> lines;
    for (std::size_t i = 0; i < history.size(); ++i) {
        if (skip_index && *skip_index == i) {
            continue;
        }
        const auto& turn = history[i];
        if (!is_known_role(turn.role)) {
            continue;
        }
        lines.push_back(role_label(turn.role) + ": " + turn.content);
    }

    if (lines.empty()) {
        return prompt;
    }

    lines.push_back("User: " + prompt);
    lines.push_back("Assistant:");

    std::ostringstream oss;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            oss << "\n";
        }
        oss << lines[i];
    }
    return oss.str();
}

Json::Value MessageComposer::build_chat_payload(const GenerationRequest& request)
{
    Json::Value messages(Json::arrayValue);
    for (const auto& turn : request.history) {
        if (!is_known_role(turn.role)) {
            continue;
        }
        // History images are never re-sent; only the live turn is inspected by the model.
        Json::Value message;
        message["role"] = turn.role;
        message["content"] = turn.content;
        messages.append(message);
    }

    Json::Value live;
    live["role"] = "user";
    live["content"] = request.prompt;
    if (!request.images.empty()) {
        live["images"] = to_json_array(request.images);
    }
    messages.append(live);

    Json::Value payload;
    payload["model"] = request.model;
    payload["messages"] = messages;
    payload["stream"] = false;
    if (request.keep_alive) {
        payload["keep_alive"] = *request.keep_alive;
    }
    if (request.format) {
        payload["format"] = *request.format;
    }
    if (request.options_json) {
        payload["options"] = parse_options(*request.options_json);
    }
    return payload;
}

Json::Value MessageComposer::build_generate_payload(const GenerationRequest& request)
{
    const auto system_index = find_last_system_turn(request.history);

    Json::Value payload;
    payload["model"] = request.model;
    payload["prompt"] = compose_prompt(request.history, request.prompt, system_index);
    payload["stream"] = false;
    if (system_index) {
        payload["system"] = request.history[*system_index].content;
    }
    if (!request.images.empty()) {
        payload["images"] = to_json_array(request.images);
    }
    if (request.keep_alive) {
        payload["keep_alive"] = *request.keep_alive;
    }
    return payload;
}
