#include "config/configuration.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace SpecOpt {
namespace Config {

// Helper function to safely get optional values
template<typename T>
std::optional<T> get_optional(const json& j, const std::string& key) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return std::nullopt;
}

// Value or default when the key is absent
template<typename T>
T get_or(const json& j, const std::string& key, const T& fallback) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return fallback;
}

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

} // namespace

ComputationConfig ComputationConfig::from_json(const json& j) {
    ComputationConfig config;
    config.mode = j["mode"].get<std::string>();
    config.description = get_or<std::string>(j, "description", "");
    config.omp_threads = get_optional<int>(j, "omp_threads");
    return config;
}

EncoderConfig EncoderConfig::from_json(const json& j) {
    EncoderConfig config;
    config.num_buckets = get_or(j, "num_buckets", config.num_buckets);
    return config;
}

EnvironmentConfig EnvironmentConfig::from_json(const json& j) {
    EnvironmentConfig config;
    config.horizon = get_or(j, "horizon", config.horizon);
    config.max_objects = get_or(j, "max_objects", config.max_objects);
    config.material_palette = get_optional<std::vector<std::string>>(j, "material_palette");
    config.resize_factors = get_optional<std::vector<double>>(j, "resize_factors");
    config.addable_types = get_optional<std::vector<std::string>>(j, "addable_types");
    config.min_dimension = get_or(j, "min_dimension", config.min_dimension);
    config.max_dimension = get_or(j, "max_dimension", config.max_dimension);
    config.violation_penalty = get_or(j, "violation_penalty", config.violation_penalty);
    config.reward_mode = get_or(j, "reward_mode", config.reward_mode);
    return config;
}

RewardModelConfig RewardModelConfig::from_json(const json& j) {
    RewardModelConfig config;
    config.hidden_dim = get_or(j, "hidden_dim", config.hidden_dim);
    config.checkpoint = get_optional<std::string>(j, "checkpoint");
    config.seed = get_or(j, "seed", config.seed);
    config.initialize_if_missing = get_or(j, "initialize_if_missing", config.initialize_if_missing);
    return config;
}

PolicyConfig PolicyConfig::from_json(const json& j) {
    PolicyConfig config;
    config.hidden_dim = get_or(j, "hidden_dim", config.hidden_dim);
    config.checkpoint = get_optional<std::string>(j, "checkpoint");
    return config;
}

TrainingConfig TrainingConfig::from_json(const json& j) {
    TrainingConfig config;
    config.steps = get_or(j, "steps", config.steps);
    config.env_count = get_or(j, "env_count", config.env_count);
    config.rollout_length = get_or(j, "rollout_length", config.rollout_length);
    config.n_epochs = get_or(j, "n_epochs", config.n_epochs);
    config.minibatch_size = get_or(j, "minibatch_size", config.minibatch_size);
    config.learning_rate = get_or(j, "learning_rate", config.learning_rate);
    config.gamma = get_or(j, "gamma", config.gamma);
    config.gae_lambda = get_or(j, "gae_lambda", config.gae_lambda);
    config.clip_epsilon = get_or(j, "clip_epsilon", config.clip_epsilon);
    config.value_coef = get_or(j, "value_coef", config.value_coef);
    config.entropy_coef = get_or(j, "entropy_coef", config.entropy_coef);
    config.max_grad_norm = get_or(j, "max_grad_norm", config.max_grad_norm);
    config.normalize_advantages = get_or(j, "normalize_advantages", config.normalize_advantages);
    config.seed = get_or(j, "seed", config.seed);
    config.checkpoint_every = get_or(j, "checkpoint_every", config.checkpoint_every);
    config.keep_checkpoints = get_or(j, "keep_checkpoints", config.keep_checkpoints);
    config.resume = get_or(j, "resume", config.resume);
    config.local_step_threshold = get_or(j, "local_step_threshold", config.local_step_threshold);
    config.num_threads = get_optional<int>(j, "num_threads");
    return config;
}

RewardTrainingConfig RewardTrainingConfig::from_json(const json& j) {
    RewardTrainingConfig config;
    config.epochs = get_or(j, "epochs", config.epochs);
    config.batch_size = get_or(j, "batch_size", config.batch_size);
    config.learning_rate = get_or(j, "learning_rate", config.learning_rate);
    config.weight_decay = get_or(j, "weight_decay", config.weight_decay);
    config.margin = get_or(j, "margin", config.margin);
    config.loss = get_or(j, "loss", config.loss);
    config.min_rating_delta = get_or(j, "min_rating_delta", config.min_rating_delta);
    config.seed = get_or(j, "seed", config.seed);
    return config;
}

ServiceConfig ServiceConfig::from_json(const json& j) {
    ServiceConfig config;
    config.strategy = get_or(j, "strategy", config.strategy);
    config.neutral_score = get_or(j, "neutral_score", config.neutral_score);
    return config;
}

DataConfig DataConfig::from_json(const json& j) {
    DataConfig config;
    config.base_specs = get_optional<std::string>(j, "base_specs");
    config.feedback_log = get_optional<std::string>(j, "feedback_log");
    config.input_spec = get_optional<std::string>(j, "input_spec");
    config.prompt = get_optional<std::string>(j, "prompt");
    config.output_file = get_optional<std::string>(j, "output_file");
    config.output_dir = get_or(j, "output_dir", config.output_dir);
    config.job_spool_dir = get_or(j, "job_spool_dir", config.job_spool_dir);
    return config;
}

LoggingConfig LoggingConfig::from_json(const json& j) {
    LoggingConfig config;
    config.level = get_or(j, "level", config.level);
    config.directory = get_or(j, "directory", config.directory);
    config.console = get_or(j, "console", config.console);
    return config;
}

// Configuration implementations
std::unique_ptr<Configuration> Configuration::load_from_file(const std::string& filepath) {
    Utils::ModuleLogger logger("CONFIG");

    logger.info("Loading configuration from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger.error("Failed to open configuration file: " + filepath);
        throw std::runtime_error("Cannot open configuration file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return load_from_string(buffer.str());
}

std::unique_ptr<Configuration> Configuration::load_from_string(const std::string& json_str) {
    Utils::ModuleLogger logger("CONFIG");

    try {
        json j = json::parse(json_str);

        auto config = std::make_unique<Configuration>();
        config->parse_json(j);

        logger.info("Configuration loaded successfully");
        return config;
    } catch (const json::exception& e) {
        logger.error("JSON parsing error: " + std::string(e.what()));
        throw std::runtime_error("Invalid JSON configuration: " + std::string(e.what()));
    }
}

void Configuration::parse_json(const json& j) {
    if (!j.is_object() || !j.contains("computation")) {
        throw std::runtime_error("Configuration missing required section 'computation'");
    }

    computation_config_ = ComputationConfig::from_json(j["computation"]);

    // Remaining sections are optional and fall back to defaults
    const json empty = json::object();
    auto section = [&](const char* name) -> const json& {
        return j.contains(name) && j[name].is_object() ? j[name] : empty;
    };

    encoder_config_ = EncoderConfig::from_json(section("encoder"));
    environment_config_ = EnvironmentConfig::from_json(section("environment"));
    reward_model_config_ = RewardModelConfig::from_json(section("reward_model"));
    policy_config_ = PolicyConfig::from_json(section("policy"));
    training_config_ = TrainingConfig::from_json(section("training"));
    reward_training_config_ = RewardTrainingConfig::from_json(section("reward_training"));
    service_config_ = ServiceConfig::from_json(section("service"));
    data_config_ = DataConfig::from_json(section("data"));
    logging_config_ = LoggingConfig::from_json(section("logging"));
}

bool Configuration::validate() const {
    Utils::ModuleLogger logger("CONFIG");
    bool ok = true;
    auto fail = [&](const std::string& message) {
        logger.error(message);
        ok = false;
    };

    const std::string& mode = computation_config_.mode;
    if (mode != "train_policy" && mode != "train_reward" && mode != "suggest" && mode != "score") {
        fail("Invalid computation mode: " + mode);
    }

    if (encoder_config_.num_buckets <= 0) {
        fail("encoder.num_buckets must be positive");
    }

    const auto& env = environment_config_;
    if (env.horizon <= 0 || env.max_objects <= 0) {
        fail("environment.horizon and environment.max_objects must be positive");
    }
    if (env.min_dimension <= 0.0 || env.min_dimension >= env.max_dimension) {
        fail("environment.min_dimension must be positive and below max_dimension");
    }
    if (env.reward_mode != "score" && env.reward_mode != "improvement") {
        fail("Invalid environment.reward_mode: " + env.reward_mode);
    }
    if (env.resize_factors) {
        for (double f : *env.resize_factors) {
            if (f <= 0.0) {
                fail("environment.resize_factors must be positive");
                break;
            }
        }
    }

    if (reward_model_config_.hidden_dim <= 0 || policy_config_.hidden_dim <= 0) {
        fail("hidden_dim must be positive");
    }

    const auto& tr = training_config_;
    if (tr.steps == 0 || tr.env_count <= 0 || tr.rollout_length <= 0 || tr.n_epochs <= 0 ||
        tr.minibatch_size <= 0 || tr.learning_rate <= 0.0f) {
        fail("Invalid training parameters");
    }
    if (tr.gamma < 0.0f || tr.gamma > 1.0f || tr.gae_lambda < 0.0f || tr.gae_lambda > 1.0f) {
        fail("training.gamma and training.gae_lambda must lie in [0, 1]");
    }
    if (tr.clip_epsilon <= 0.0f) {
        fail("training.clip_epsilon must be positive");
    }

    const auto& rt = reward_training_config_;
    if (rt.epochs <= 0 || rt.batch_size <= 0 || rt.learning_rate <= 0.0f) {
        fail("Invalid reward_training parameters");
    }
    if (rt.loss != "margin" && rt.loss != "bradley_terry") {
        fail("Invalid reward_training.loss: " + rt.loss);
    }

    const std::string& strategy = service_config_.strategy;
    if (strategy != "auto" && strategy != "policy_rollout" && strategy != "reward_only" &&
        strategy != "heuristic_fallback") {
        fail("Invalid service.strategy: " + strategy);
    }

    // Mode-specific inputs
    if (mode == "train_policy") {
        if (!data_config_.base_specs) fail("train_policy requires data.base_specs");
        if (!reward_model_config_.checkpoint) fail("train_policy requires reward_model.checkpoint");
    } else if (mode == "train_reward") {
        if (!data_config_.feedback_log) fail("train_reward requires data.feedback_log");
        if (!reward_model_config_.checkpoint) fail("train_reward requires reward_model.checkpoint");
    } else if (mode == "suggest" || mode == "score") {
        if (!data_config_.input_spec) fail(mode + " requires data.input_spec");
        if (!reward_model_config_.checkpoint) {
            logger.warning("No reward model configured; scores will be the neutral constant");
        }
    }

    if (ok) {
        logger.info("Configuration validation successful");
    }
    return ok;
}

void Configuration::print_summary() const {
    Utils::ModuleLogger logger("CONFIG");

    logger.info("=== Configuration Summary ===");
    logger.info("");

    logger.info("Computation:");
    logger.info("  Mode: " + computation_config_.mode);
    if (!computation_config_.description.empty()) {
        logger.info("  Description: " + computation_config_.description);
    }
    if (computation_config_.omp_threads) {
        logger.info("  OpenMP threads: " + std::to_string(*computation_config_.omp_threads));
    }
    logger.info("");

    logger.info("Encoder / Environment:");
    logger.info("  Buckets: " + std::to_string(encoder_config_.num_buckets));
    logger.info("  Horizon: " + std::to_string(environment_config_.horizon));
    logger.info("  Max objects: " + std::to_string(environment_config_.max_objects));
    if (environment_config_.material_palette) {
        logger.info("  Palette: " + join(*environment_config_.material_palette));
    }
    if (environment_config_.addable_types) {
        logger.info("  Addable types: " + join(*environment_config_.addable_types));
    }
    logger.info("  Reward mode: " + environment_config_.reward_mode);
    logger.info("");

    logger.info("Models:");
    logger.info("  Reward model: " + reward_model_config_.checkpoint.value_or("(none)") +
                " (H=" + std::to_string(reward_model_config_.hidden_dim) + ")");
    logger.info("  Policy: " + policy_config_.checkpoint.value_or("(none)") +
                " (H=" + std::to_string(policy_config_.hidden_dim) + ")");
    logger.info("");

    const std::string& mode = computation_config_.mode;
    if (mode == "train_policy") {
        const auto& tr = training_config_;
        logger.info("Training:");
        logger.info("  Steps: " + std::to_string(tr.steps) + " over " + std::to_string(tr.env_count) + " envs");
        logger.info("  Rollout length: " + std::to_string(tr.rollout_length));
        logger.info("  Epochs / minibatch: " + std::to_string(tr.n_epochs) + " / " +
                    std::to_string(tr.minibatch_size));
        logger.info("  Learning rate: " + std::to_string(tr.learning_rate));
        logger.info("  Clip epsilon: " + std::to_string(tr.clip_epsilon));
        logger.info("  Checkpoint every: " + std::to_string(tr.checkpoint_every) + " updates");
        logger.info("  Resume: " + std::string(tr.resume ? "yes" : "no"));
        logger.info("  Local step threshold: " + std::to_string(tr.local_step_threshold));
    } else if (mode == "train_reward") {
        const auto& rt = reward_training_config_;
        logger.info("Reward training:");
        logger.info("  Epochs: " + std::to_string(rt.epochs) + ", batch " + std::to_string(rt.batch_size));
        logger.info("  Loss: " + rt.loss);
        logger.info("  Learning rate: " + std::to_string(rt.learning_rate));
    } else {
        logger.info("Service:");
        logger.info("  Strategy: " + service_config_.strategy);
        logger.info("  Neutral score: " + std::to_string(service_config_.neutral_score));
    }
    logger.info("");

    logger.info("Data:");
    if (data_config_.base_specs) logger.info("  Base specs: " + *data_config_.base_specs);
    if (data_config_.feedback_log) logger.info("  Feedback log: " + *data_config_.feedback_log);
    if (data_config_.input_spec) logger.info("  Input spec: " + *data_config_.input_spec);
    if (data_config_.output_file) logger.info("  Output file: " + *data_config_.output_file);
    logger.info("  Output dir: " + data_config_.output_dir);

    logger.info("=============================");
}

} // namespace Config
} // namespace SpecOpt
