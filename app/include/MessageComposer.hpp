#ifndef MESSAGE_COMPOSER_HPP
#define MESSAGE_COMPOSER_HPP

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Json { class Value; }

/**
 * @brief Everything needed to render one generation call in either wire form.
 */
struct GenerationRequest {
    std::string model;
    std::string prompt;
    std::vector<ConversationTurn> history;
    std::vector<std::string> images;          ///< Base64 images for the live turn.
    std::optional<std::string> keep_alive;
    std::optional<std::string> format;        ///< /api/chat only, e.g. "json".
    std::optional<std::string> options_json;  ///< /api/chat only, raw JSON object.
};

class MessageComposer {
public:
    /// Body for POST /api/chat.
    static Json::Value build_chat_payload(const GenerationRequest& request);

    /// Body for POST /api/generate.
    static Json::Value build_generate_payload(const GenerationRequest& request);

    /**
     * @brief Flattens history into a "Role: content" transcript ending with "Assistant:".
     * @param skip_index History index excluded from the transcript (the extracted system turn).
     */
    static std::string compose_prompt(const std::vector<ConversationTurn>& history,
                                      const std::string& prompt,
                                      std::optional<std::size_t> skip_index = std::nullopt);

    static std::optional<std::size_t> find_last_system_turn(const std::vector<ConversationTurn>& history);

    static std::string role_label(const std::string& role);
};

#endif // MESSAGE_COMPOSER_HPP
