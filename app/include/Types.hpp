#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ConversationTurn {
    std::string role;
    std::string content;
    std::vector<std::string> images; ///< Base64 payloads; only honored on the live turn.
};

inline bool is_known_role(const std::string& role) {
    return role == "system"
        || role == "user"
        || role == "assistant"
        || role == "tool";
}

enum class TaskType {Vision, Code, General};

inline std::string to_string(TaskType task) {
    switch (task) {
        case TaskType::Vision: return "vision";
        case TaskType::Code: return "code";
        case TaskType::General: return "general";
        default: return "unknown";
    }
}

enum class VisionSupport {Supported, Unsupported, Unknown};

inline std::string to_string(VisionSupport support) {
    switch (support) {
        case VisionSupport::Supported: return "yes";
        case VisionSupport::Unsupported: return "no";
        case VisionSupport::Unknown: return "unknown";
        default: return "unknown";
    }
}

struct OrchestrationDecision {
    std::string selected_model;
    bool changed_from_preferred{false};
    bool suitable_model_found{true};
};

enum class GenerationEndpoint {Chat, Generate};

struct GenerationResult {
    std::string text;
    std::string model;
    GenerationEndpoint endpoint{GenerationEndpoint::Generate};
    bool fallback_used{false};
};

/**
 * @brief One installable model scraped from the public catalog listing.
 */
struct CatalogEntry {
    std::string name;
    std::string description;
    std::vector<std::string> capabilities; ///< Subset of vision/tools/thinking/embedding/cloud, unique.
    std::vector<std::string> sizes;        ///< Size tags in document order, e.g. "8b", "8x7b".
    std::string pulls;
    std::string tag_count;
    std::string updated;
};

struct PullProgress {
    std::string phase;
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};

    bool has_sizes() const {
        return bytes_total > 0 && bytes_done > 0;
    }

    double percent() const {
        if (bytes_total == 0) {
            return 0.0;
        }
        return 100.0 * static_cast<double>(bytes_done) / static_cast<double>(bytes_total);
    }
};

struct WebSearchResult {
    std::string title;
    std::string url;
    std::string content;
};

#endif
