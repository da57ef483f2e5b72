#include "config/configuration.hpp"
#include "executor/pipeline_executor.hpp"
#include "service/suggestion_service.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::atomic<SpecOpt::RL::CancellationToken*> g_cancel{nullptr};

void handle_sigint(int) {
    SpecOpt::RL::CancellationToken* token = g_cancel.load();
    if (token) {
        token->cancel();
    }
}

} // namespace

void print_usage(const std::string& program_name) {
    std::cout << "SpecOpt CLI - Design Spec Optimization\n";
    std::cout << "======================================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " --config <config_file.json>\n";
    std::cout << "  " << program_name << " -c <config_file.json>\n";
    std::cout << "  " << program_name << " --suggest <spec.json> [options]\n";
    std::cout << "  " << program_name << " --score <spec.json> [options]\n";
    std::cout << "  " << program_name << " --list-configs\n";
    std::cout << "  " << program_name << " --validate <config_file.json>\n";
    std::cout << "  " << program_name << " --help\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config, -c <file>    Load and execute configuration from JSON file\n";
    std::cout << "  --suggest <spec>       Improve a spec and print the suggestion as JSON\n";
    std::cout << "  --score <spec>         Score a spec with the reward model\n";
    std::cout << "    --prompt <text>      Design prompt (default: empty)\n";
    std::cout << "    --strategy <name>    auto | policy_rollout | reward_only | heuristic_fallback\n";
    std::cout << "    --reward-model <f>   Reward model checkpoint\n";
    std::cout << "    --policy <f>         Policy checkpoint\n";
    std::cout << "  --list-configs         List all available configuration files\n";
    std::cout << "  --validate <file>      Validate configuration file without executing\n";
    std::cout << "  --help, -h             Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --config configs/train_policy.json\n";
    std::cout << "  " << program_name << " --suggest data/living_room.json --prompt \"warm modern living room\"\n";
    std::cout << "  " << program_name << " --validate configs/train_reward.json\n\n";
}

void list_configs() {
    std::cout << "Available Configuration Files:\n";
    std::cout << "==============================\n\n";

    std::string configs_dir = "configs";

    if (!fs::exists(configs_dir) || !fs::is_directory(configs_dir)) {
        std::cout << "No configs directory found.\n";
        return;
    }

    std::vector<std::string> config_files;

    for (const auto& entry : fs::directory_iterator(configs_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            config_files.push_back(entry.path().string());
        }
    }

    std::sort(config_files.begin(), config_files.end());

    if (config_files.empty()) {
        std::cout << "No JSON configuration files found in configs/\n";
        return;
    }

    for (const auto& file : config_files) {
        std::cout << "  - " << file << "\n";

        // Try to load and show description
        try {
            auto config = SpecOpt::Config::Configuration::load_from_file(file);
            const auto& comp_config = config->get_computation_config();
            std::cout << "    " << comp_config.description << "\n";
            std::cout << "    Mode: " << comp_config.mode << "\n\n";
        } catch (const std::exception& e) {
            std::cout << "    (Unable to parse: " << e.what() << ")\n\n";
        }
    }
}

bool validate_config(const std::string& config_file) {
    SpecOpt::Utils::ModuleLogger logger("VALIDATE");

    logger.info("Validating configuration file: " + config_file);

    try {
        auto config = SpecOpt::Config::Configuration::load_from_file(config_file);

        logger.info("");
        config->print_summary();
        logger.info("");

        if (config->validate()) {
            logger.info("Configuration is valid");
            return true;
        } else {
            logger.error("Configuration validation failed");
            return false;
        }
    } catch (const std::exception& e) {
        logger.error("Error loading configuration: " + std::string(e.what()));
        return false;
    }
}

// --suggest / --score without a config file
int run_service_command(const std::string& command, const std::string& spec_path,
                        const std::vector<std::string>& extra_args) {
    SpecOpt::Utils::ModuleLogger logger(command == "--score" ? "SCORE" : "SUGGEST");

    SpecOpt::Service::ServiceOptions options;
    std::string prompt;
    std::string strategy_name = "auto";

    for (size_t i = 0; i < extra_args.size(); i++) {
        if (extra_args[i] == "--prompt" && i + 1 < extra_args.size()) {
            prompt = extra_args[++i];
        } else if (extra_args[i] == "--strategy" && i + 1 < extra_args.size()) {
            strategy_name = extra_args[++i];
        } else if (extra_args[i] == "--reward-model" && i + 1 < extra_args.size()) {
            options.reward_model_path = extra_args[++i];
        } else if (extra_args[i] == "--policy" && i + 1 < extra_args.size()) {
            options.policy_path = extra_args[++i];
        } else {
            std::cerr << "Error: unknown option '" << extra_args[i] << "'\n";
            return 1;
        }
    }

    try {
        auto spec = SpecOpt::Spec::DesignSpecification::load_from_file(spec_path);
        auto service = SpecOpt::Service::SuggestionService::create(options);

        if (command == "--score") {
            SpecOpt::Spec::json result;
            result["score"] = service->score(spec, prompt);
            result["score_source"] = service->has_reward_model() ? "reward_model" : "neutral";
            std::cout << result.dump(2) << std::endl;
            return 0;
        }

        auto suggestion = service->suggest(spec, prompt, SpecOpt::Service::parse_strategy(strategy_name));
        std::cout << suggestion.to_json().dump(2) << std::endl;
        return 0;
    } catch (const SpecOpt::Utils::InvalidSpec& e) {
        logger.error(e.what());
        return 2;
    } catch (const std::exception& e) {
        logger.error("Error: " + std::string(e.what()));
        return 1;
    }
}

int main(int argc, char** argv) {
    // Initialize logger
    SpecOpt::Utils::Logger::instance().set_log_directory("logs");
    SpecOpt::Utils::ModuleLogger main_logger("CLI");

    // Parse command line arguments
    std::vector<std::string> args(argv, argv + argc);

    if (argc < 2) {
        print_usage(args[0]);
        return 1;
    }

    std::string command = args[1];

    // Handle help
    if (command == "--help" || command == "-h") {
        print_usage(args[0]);
        return 0;
    }

    // Handle list configs
    if (command == "--list-configs") {
        list_configs();
        return 0;
    }

    // Handle validate
    if (command == "--validate") {
        if (argc < 3) {
            std::cerr << "Error: --validate requires a configuration file path\n";
            print_usage(args[0]);
            return 1;
        }
        return validate_config(args[2]) ? 0 : 1;
    }

    // Handle one-shot service commands
    if (command == "--suggest" || command == "--score") {
        if (argc < 3) {
            std::cerr << "Error: " << command << " requires a spec file path\n";
            print_usage(args[0]);
            return 1;
        }
        std::vector<std::string> extra_args(args.begin() + 3, args.end());
        return run_service_command(command, args[2], extra_args);
    }

    // Handle config execution
    if (command == "--config" || command == "-c") {
        if (argc < 3) {
            std::cerr << "Error: " << command << " requires a configuration file path\n";
            print_usage(args[0]);
            return 1;
        }

        std::string config_file = args[2];

        main_logger.info("=== SpecOpt CLI ===");
        main_logger.info("Configuration file: " + config_file);
        main_logger.info("");

        try {
            // Load configuration
            auto config = SpecOpt::Config::Configuration::load_from_file(config_file);
            SpecOpt::Executor::apply_runtime_settings(*config);

            // Print configuration summary
            main_logger.info("");
            config->print_summary();
            main_logger.info("");

            // Validate configuration
            if (!config->validate()) {
                main_logger.error("Configuration validation failed. Aborting.");
                return 1;
            }

            main_logger.info("");

            // Execute computation; Ctrl-C stops training after the current update
            SpecOpt::Executor::PipelineExecutor executor(*config);
            g_cancel.store(&executor.cancellation_token());
            std::signal(SIGINT, handle_sigint);

            executor.execute();

            std::signal(SIGINT, SIG_DFL);
            g_cancel.store(nullptr);

            main_logger.info("");
            main_logger.info("Execution status: " + executor.get_status());

            return 0;
        } catch (const SpecOpt::Utils::TrainingInterrupted& e) {
            std::signal(SIGINT, SIG_DFL);
            g_cancel.store(nullptr);
            main_logger.warning(std::string(e.what()) + "; rerun with training.resume=true to continue");
            return 130;
        } catch (const std::exception& e) {
            std::signal(SIGINT, SIG_DFL);
            g_cancel.store(nullptr);
            main_logger.critical("Error: " + std::string(e.what()));
            return 1;
        }
    }

    // Unknown command
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    print_usage(args[0]);
    return 1;
}
