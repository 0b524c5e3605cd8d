/*
 * llm-gateway
 *
 * Headless front end for the gateway core.
 *
 * Usage:
 *   llm-gateway --health
 *   llm-gateway --list-models
 *   llm-gateway --ask "explain this stack trace" --model llama3
 *   llm-gateway --ask "what is in this picture?" --image photo.jpg
 *   llm-gateway --pull llava
 *
 * Configuration comes from LLM_GATEWAY_CONFIG (INI file) and the OLLAMA_*
 * environment variables.
 */

#include "Gateway.hpp"
#include "GatewayErrors.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kSearchResults = 5;

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int)
{
    g_interrupted.store(true);
}

enum class Command {None, Health, ListModels, Show, Ask, Catalog, Pull, Delete, Search};

struct CliOptions {
    Command command{Command::None};
    std::string argument;
    std::optional<std::string> model;
    std::vector<std::string> image_paths;
};

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " <COMMAND> [OPTIONS]\n\n"
              << "Commands:\n"
              << "  --health                  Check that the local backend answers\n"
              << "  --list-models             List installed models\n"
              << "  --show <model>            Show model details\n"
              << "  --ask <prompt>            Pick a model and generate a reply\n"
              << "      --model <name>        Preferred model (default OLLAMA_DEFAULT_MODEL)\n"
              << "      --image <file>        Attach an image (repeatable)\n"
              << "  --catalog [query]         Browse the public model library\n"
              << "  --pull <model>            Download a model (Ctrl-C cancels)\n"
              << "  --delete <model>          Remove an installed model\n"
              << "  --search <query>          Web search (requires OLLAMA_API_KEY)\n"
              << "  --help                    Show this help message\n\n"
              << "Environment Variables:\n"
              << "  LLM_GATEWAY_CONFIG        INI file with [ollama] and [gateway] sections\n"
              << "  OLLAMA_BASE_URL           Local backend (default http://localhost:11434)\n"
              << "  OLLAMA_CLOUD_URL          Remote backend for -cloud models\n"
              << "  OLLAMA_API_KEY            Credential for the remote backend\n"
              << "  LOG_LEVEL                 trace, debug, info, warn, error\n";
}

bool set_command(CliOptions& options, Command command)
{
    if (options.command != Command::None) {
        std::cerr << "Error: only one command may be given\n\n";
        return false;
    }
    options.command = command;
    return true;
}

std::optional<CliOptions> parse_arguments(int argc, char* argv[])
{
    CliOptions options;
    auto needs_value = [&](int i, const char* flag) {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << flag << " requires a value\n\n";
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--health") == 0) {
            if (!set_command(options, Command::Health)) return std::nullopt;
        } else if (std::strcmp(arg, "--list-models") == 0) {
            if (!set_command(options, Command::ListModels)) return std::nullopt;
        } else if (std::strcmp(arg, "--catalog") == 0) {
            if (!set_command(options, Command::Catalog)) return std::nullopt;
            if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0) {
                options.argument = argv[++i];
            }
        } else if (std::strcmp(arg, "--show") == 0 || std::strcmp(arg, "--ask") == 0
                   || std::strcmp(arg, "--pull") == 0 || std::strcmp(arg, "--delete") == 0
                   || std::strcmp(arg, "--search") == 0) {
            if (!needs_value(i, arg)) return std::nullopt;
            Command command = Command::Show;
            if (std::strcmp(arg, "--ask") == 0) command = Command::Ask;
            else if (std::strcmp(arg, "--pull") == 0) command = Command::Pull;
            else if (std::strcmp(arg, "--delete") == 0) command = Command::Delete;
            else if (std::strcmp(arg, "--search") == 0) command = Command::Search;
            if (!set_command(options, command)) return std::nullopt;
            options.argument = argv[++i];
        } else if (std::strcmp(arg, "--model") == 0) {
            if (!needs_value(i, arg)) return std::nullopt;
            options.model = argv[++i];
        } else if (std::strcmp(arg, "--image") == 0) {
            if (!needs_value(i, arg)) return std::nullopt;
            options.image_paths.emplace_back(argv[++i]);
        } else {
            std::cerr << "Error: unknown argument '" << arg << "'\n\n";
            return std::nullopt;
        }
    }

    if (options.command == Command::None) {
        std::cerr << "Error: specify a command\n\n";
        return std::nullopt;
    }
    if ((options.model || !options.image_paths.empty()) && options.command != Command::Ask) {
        std::cerr << "Error: --model and --image only apply to --ask\n\n";
        return std::nullopt;
    }
    if (Utils::trim(options.argument).empty() && options.command != Command::Health
        && options.command != Command::ListModels && options.command != Command::Catalog) {
        std::cerr << "Error: empty argument\n\n";
        return std::nullopt;
    }
    return options;
}

int run_health(Gateway& gateway)
{
    std::cout << "Base URL: " << gateway.router().local_base_url() << "\n";
    HealthResult health = gateway.client().check_health();
    if (health.ok) {
        std::cout << "Status: OK\n";
        return kExitOk;
    }
    std::cout << "Status: FAILED\n";
    std::cout << "Error: " << health.message << "\n";
    if (health.http_code > 0) {
        std::cout << "HTTP Code: " << health.http_code << "\n";
    }
    return kExitError;
}

int run_list_models(Gateway& gateway)
{
    ListModelsResult result = gateway.client().list_models();
    if (!result.ok) {
        std::cout << "Error: " << result.error_message << "\n";
        return kExitError;
    }

    std::cout << "Models (" << result.models.size() << "):\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& model : result.models) {
        std::cout << "  " << model << "\n";
    }
    if (result.models.empty()) {
        std::cout << "  (no models found)\n";
    }
    return kExitOk;
}

int run_show(Gateway& gateway, const std::string& model)
{
    const ModelDetails details = gateway.client().describe_model(model);
    std::cout << details.display_name() << "\n";
    if (!details.family.empty()) {
        std::cout << "  Family: " << details.family << "\n";
    }
    if (!details.architecture.empty()) {
        std::cout << "  Architecture: " << details.architecture << "\n";
    }
    if (!details.parameter_size.empty()) {
        std::cout << "  Parameters: " << details.parameter_size << "\n";
    }
    if (!details.quantization_level.empty()) {
        std::cout << "  Quantization: " << details.quantization_level << "\n";
    }
    if (details.size_bytes > 0) {
        std::cout << "  Size: " << Utils::format_megabytes(details.size_bytes) << "\n";
    }
    if (!details.capabilities.empty()) {
        std::cout << "  Capabilities:";
        for (const auto& capability : details.capabilities) {
            std::cout << " " << capability;
        }
        std::cout << "\n";
    }
    std::cout << "  Vision: " << to_string(gateway.capabilities().supports_vision(model)) << "\n";
    if (details.system_prompt) {
        std::cout << "  System: " << *details.system_prompt << "\n";
    }
    return kExitOk;
}

int run_ask(Gateway& gateway, const CliOptions& options)
{
    std::vector<std::string> images;
    for (const auto& path : options.image_paths) {
        images.push_back(Utils::base64_encode(Utils::read_file(path)));
    }

    const GatewayReply reply = gateway.ask(options.argument, images, {}, options.model);
    std::cout << "Task: " << to_string(reply.task) << "\n";
    std::cout << "Model: " << reply.decision.selected_model
              << (reply.decision.changed_from_preferred ? " (switched)" : "") << "\n";

    if (!reply.generation) {
        std::cerr << "Error: no installed model can read images; pull a vision model such as llava\n";
        return kExitError;
    }
    if (reply.generation->fallback_used) {
        std::cout << "Endpoint: generate (fallback)\n";
    }
    std::cout << "\n" << reply.generation->text << "\n";
    return kExitOk;
}

int run_catalog(Gateway& gateway, const std::string& query)
{
    const auto entries = filter_catalog(gateway.catalog().fetch(), query);
    if (entries.empty()) {
        std::cout << "(no matching models)\n";
        return kExitOk;
    }
    for (const auto& entry : entries) {
        std::cout << format_catalog_entry(entry) << "\n";
    }
    return kExitOk;
}

int run_pull(Gateway& gateway, const std::string& model)
{
    std::signal(SIGINT, handle_interrupt);

    PullStartResult started = gateway.downloads().start_pull(
        model,
        [](const DownloadJob& job, const PullProgress& progress) {
            std::cout << format_pull_progress(job.model(), progress) << "\n";
        });
    if (!started.ok) {
        std::cerr << "Error: " << started.error_message << "\n";
        return kExitError;
    }

    while (!started.job->wait_for(std::chrono::milliseconds(200))) {
        if (g_interrupted.load() && !started.job->cancel_requested()) {
            std::cout << "Cancelling...\n";
            gateway.downloads().cancel_all();
        }
    }

    switch (started.job->wait()) {
        case DownloadState::Completed:
            std::cout << model << ": download complete\n";
            return kExitOk;
        case DownloadState::Cancelled:
            std::cout << model << ": download cancelled\n";
            return kExitError;
        case DownloadState::Failed:
        default:
            std::cerr << "Error: " << started.job->error_message() << "\n";
            return kExitError;
    }
}

int run_delete(Gateway& gateway, const std::string& model)
{
    gateway.client().delete_model(model);
    gateway.inventory().invalidate();
    std::cout << model << ": deleted\n";
    return kExitOk;
}

int run_search(Gateway& gateway, const std::string& query)
{
    if (!gateway.client().web_search_available()) {
        std::cerr << "Error: web search requires OLLAMA_API_KEY\n";
        return kExitError;
    }
    const auto results = gateway.client().web_search(query, kSearchResults);
    if (results.empty()) {
        std::cout << "(no results)\n";
    }
    for (const auto& result : results) {
        std::cout << result.title << "\n  " << result.url << "\n";
        if (!result.content.empty()) {
            std::cout << "  " << result.content << "\n";
        }
        std::cout << "\n";
    }
    return kExitOk;
}

int run_command(Gateway& gateway, const CliOptions& options)
{
    switch (options.command) {
        case Command::Health: return run_health(gateway);
        case Command::ListModels: return run_list_models(gateway);
        case Command::Show: return run_show(gateway, options.argument);
        case Command::Ask: return run_ask(gateway, options);
        case Command::Catalog: return run_catalog(gateway, options.argument);
        case Command::Pull: return run_pull(gateway, options.argument);
        case Command::Delete: return run_delete(gateway, options.argument);
        case Command::Search: return run_search(gateway, options.argument);
        case Command::None:
        default:
            return kExitUsage;
    }
}

}

bool initialize_loggers(const std::string& level)
{
    try {
        Logger::setup_loggers(level);
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return kExitOk;
        }
    }

    const auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    Settings settings;
    try {
        settings.load();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitUsage;
    }

    if (!initialize_loggers(settings.get_log_level())) {
        return kExitError;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Error: failed to initialize libcurl\n";
        return kExitError;
    }

    int exit_code = kExitError;
    try {
        Gateway gateway(settings);
        exit_code = run_command(gateway, *options);
    } catch (const GatewayError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("command_failed error={}", e.what());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("command_failed error={}", e.what());
        }
    }

    curl_global_cleanup();
    return exit_code;
}
