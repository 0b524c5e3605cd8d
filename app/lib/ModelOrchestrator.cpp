#include "ModelOrchestrator.hpp"
#include "CapabilityCache.hpp"
#include "EndpointRouter.hpp"
#include "Logger.hpp"
#include "ModelInventory.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

std::vector<std::string> OrchestratorHeuristics::default_code_keywords()
{
    return {
        "function", "class", "method", "variable", "loop", "algorithm",
        "compile", "syntax", "runtime", "debug", "refactor", "optimize",
        "def ", "import ", "return ", "if ", "else ", "for ", "while ",
        "error", "exception", "traceback", "stack trace", "null pointer",
        "python", "javascript", "typescript", "java", "kotlin", "swift",
        "rust", "golang", "go ", "c++", "c#", "php", "ruby", "bash", "sql",
        "html", "css", "json", "yaml", "xml",
        // es
        "función", "clase", "código", "programa", "depurar", "depuración", "excepción",
        // de
        "funktion", "klasse", "fehler", "programm",
        // fr
        "fonction", "classe", "erreur", "programme",
        // it
        "funzione", "codice",
    };
}

std::vector<std::string> OrchestratorHeuristics::default_code_model_patterns()
{
    return {
        "code", "coder", "codegen", "codellama", "starcoder", "deepseek-coder",
        "qwen-coder", "wizard-coder", "phind", "magicoder", "codegemma",
        "codestral", "devstral",
    };
}

ModelOrchestrator::ModelOrchestrator(ModelInventory& inventory,
                                     CapabilityCache& capabilities,
                                     const EndpointRouter& router,
                                     OrchestratorHeuristics heuristics)
    : inventory_(inventory),
      capabilities_(capabilities),
      router_(router),
      heuristics_(std::move(heuristics))
{
    logger_ = Logger::get_logger("core_logger");
}

TaskType ModelOrchestrator::detect_task(const std::string& prompt, bool has_attachments) const
{
    if (has_attachments) {
        return TaskType::Vision;
    }

    const std::string lowered = Utils::to_lower(prompt);
    const bool code_hit = std::any_of(heuristics_.code_keywords.begin(),
                                      heuristics_.code_keywords.end(),
                                      [&lowered](const std::string& keyword) {
                                          return !keyword.empty() && lowered.find(keyword) != std::string::npos;
                                      });
    return code_hit ? TaskType::Code : TaskType::General;
}

bool ModelOrchestrator::is_code_model(const std::string& model) const
{
    const std::string lowered = Utils::to_lower(model);
    return std::any_of(heuristics_.code_model_patterns.begin(),
                       heuristics_.code_model_patterns.end(),
                       [&lowered](const std::string& pattern) {
                           return !pattern.empty() && lowered.find(pattern) != std::string::npos;
                       });
}

OrchestrationDecision ModelOrchestrator::select_model(TaskType task, const std::string& preferred)
{
    switch (task) {
        case TaskType::Vision:
            return select_vision_model(preferred);
        case TaskType::Code:
            return select_code_model(preferred);
        case TaskType::General:
        default:
            return OrchestrationDecision{preferred, false, true};
    }
}

OrchestrationDecision ModelOrchestrator::select_vision_model(const std::string& preferred)
{
    if (!preferred.empty() && router_.is_routable(preferred)
        && capabilities_.supports_vision(preferred) == VisionSupport::Supported) {
        if (logger_) {
            logger_->info("orchestrator task=vision selected={} preferred={} changed=false", preferred, preferred);
        }
        return OrchestrationDecision{preferred, false, true};
    }

    for (const auto& candidate : inventory_.models()) {
        if (candidate == preferred || !router_.is_routable(candidate)) {
            continue;
        }
        if (capabilities_.supports_vision(candidate) == VisionSupport::Supported) {
            if (logger_) {
                logger_->info("orchestrator task=vision selected={} preferred={} changed=true", candidate, preferred);
            }
            return OrchestrationDecision{candidate, true, true};
        }
    }

    if (logger_) {
        logger_->warn("orchestrator task=vision no_suitable_model preferred={}", preferred);
    }
    return OrchestrationDecision{preferred, false, false};
}

OrchestrationDecision ModelOrchestrator::select_code_model(const std::string& preferred)
{
    if (is_code_model(preferred) && router_.is_routable(preferred)) {
        return OrchestrationDecision{preferred, false, true};
    }

    for (const auto& candidate : inventory_.models()) {
        if (is_code_model(candidate) && router_.is_routable(candidate)) {
            if (logger_) {
                logger_->info("orchestrator task=code selected={} preferred={} changed=true", candidate, preferred);
            }
            return OrchestrationDecision{candidate, candidate != preferred, true};
        }
    }

    if (logger_) {
        logger_->info("orchestrator task=code no_code_model preferred={}", preferred);
    }
    return OrchestrationDecision{preferred, false, false};
}
