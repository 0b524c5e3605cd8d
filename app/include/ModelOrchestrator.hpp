#ifndef MODEL_ORCHESTRATOR_HPP
#define MODEL_ORCHESTRATOR_HPP

#include "Types.hpp"

#include <memory>
#include <string>
#include <vector>

class CapabilityCache;
class EndpointRouter;
class ModelInventory;
namespace spdlog { class logger; }

/**
 * @brief Keyword and model-name lists used by task detection and selection.
 *
 * Entries are lowercase substrings. Multibyte keywords only match when the
 * prompt uses the same case.
 */
struct OrchestratorHeuristics {
    std::vector<std::string> code_keywords = default_code_keywords();
    std::vector<std::string> code_model_patterns = default_code_model_patterns();

    static std::vector<std::string> default_code_keywords();
    static std::vector<std::string> default_code_model_patterns();
};

class ModelOrchestrator {
public:
    ModelOrchestrator(ModelInventory& inventory,
                      CapabilityCache& capabilities,
                      const EndpointRouter& router,
                      OrchestratorHeuristics heuristics = OrchestratorHeuristics());

    TaskType detect_task(const std::string& prompt, bool has_attachments) const;

    /**
     * @brief Picks the model that should serve a request of the given task type.
     *
     * A vision decision with suitable_model_found == false means the request
     * cannot be served; code decisions without a match keep the preferred model.
     * Cloud models without a configured credential are never chosen.
     */
    OrchestrationDecision select_model(TaskType task, const std::string& preferred);

    bool is_code_model(const std::string& model) const;

private:
    OrchestrationDecision select_vision_model(const std::string& preferred);
    OrchestrationDecision select_code_model(const std::string& preferred);

    ModelInventory& inventory_;
    CapabilityCache& capabilities_;
    const EndpointRouter& router_;
    OrchestratorHeuristics heuristics_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // MODEL_ORCHESTRATOR_HPP
