#ifndef FALLBACK_DETECTOR_HPP
#define FALLBACK_DETECTOR_HPP

#include <optional>
#include <regex>
#include <string>
#include <vector>

enum class FallbackReason {None, MissingImageReply, RejectedStatus};

inline std::string to_string(FallbackReason reason) {
    switch (reason) {
        case FallbackReason::None: return "none";
        case FallbackReason::MissingImageReply: return "missing_image_reply";
        case FallbackReason::RejectedStatus: return "rejected_status";
        default: return "none";
    }
}

/**
 * @brief Result of the primary /api/chat attempt of a multimodal request.
 * Exactly one of reply and error_status is set.
 */
struct ChatAttemptOutcome {
    std::optional<std::string> reply;
    std::optional<int> error_status;

    static ChatAttemptOutcome succeeded(std::string text) {
        ChatAttemptOutcome outcome;
        outcome.reply = std::move(text);
        return outcome;
    }

    static ChatAttemptOutcome failed(int status) {
        ChatAttemptOutcome outcome;
        outcome.error_status = status;
        return outcome;
    }
};

/**
 * @brief Decides whether a multimodal chat attempt earns one /api/generate retry.
 *
 * Some backends silently drop images sent through /api/chat and answer with
 * "please send me an image". The phrase list is heuristic and can misfire on
 * replies that discuss missing images as a topic.
 */
class FallbackDetector {
public:
    explicit FallbackDetector(std::vector<std::string> patterns = default_patterns(),
                              std::vector<int> fallback_statuses = default_fallback_statuses());

    static std::vector<std::string> default_patterns();
    static std::vector<int> default_fallback_statuses();

    bool looks_like_missing_image(const std::string& text) const;
    bool is_fallback_status(int status) const;
    FallbackReason evaluate(const ChatAttemptOutcome& outcome) const;

private:
    std::vector<std::regex> patterns_;
    std::vector<int> fallback_statuses_;
};

#endif // FALLBACK_DETECTOR_HPP
