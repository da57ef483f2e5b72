#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SpecOpt {
namespace Config {

using json = nlohmann::json;

// What the executor runs
struct ComputationConfig {
    std::string mode;                   // "train_policy", "train_reward", "suggest" or "score"
    std::string description;
    std::optional<int> omp_threads;     // OpenMP threads for matrix kernels

    static ComputationConfig from_json(const json& j);
};

struct EncoderConfig {
    int num_buckets = 512;

    static EncoderConfig from_json(const json& j);
};

// Action space and MDP settings
struct EnvironmentConfig {
    int horizon = 16;
    int max_objects = 8;
    std::optional<std::vector<std::string>> material_palette;
    std::optional<std::vector<double>> resize_factors;
    std::optional<std::vector<std::string>> addable_types;
    double min_dimension = 0.01;
    double max_dimension = 12.0;
    float violation_penalty = -1.0f;
    std::string reward_mode = "score";

    static EnvironmentConfig from_json(const json& j);
};

struct RewardModelConfig {
    int hidden_dim = 64;
    std::optional<std::string> checkpoint;
    uint32_t seed = 7;
    bool initialize_if_missing = false; // train_reward only: start from random weights

    static RewardModelConfig from_json(const json& j);
};

struct PolicyConfig {
    int hidden_dim = 64;
    std::optional<std::string> checkpoint;

    static PolicyConfig from_json(const json& j);
};

// PPO run
struct TrainingConfig {
    uint64_t steps = 4096;
    int env_count = 4;
    int rollout_length = 64;
    int n_epochs = 4;
    int minibatch_size = 64;
    float learning_rate = 3e-4f;
    float gamma = 0.99f;
    float gae_lambda = 0.95f;
    float clip_epsilon = 0.2f;
    float value_coef = 0.5f;
    float entropy_coef = 0.01f;
    float max_grad_norm = 0.5f;
    bool normalize_advantages = true;
    uint32_t seed = 42;
    int checkpoint_every = 10;
    int keep_checkpoints = 0;
    bool resume = false;
    uint64_t local_step_threshold = 100000;
    std::optional<int> num_threads;

    static TrainingConfig from_json(const json& j);
};

// Offline reward model fitting from feedback
struct RewardTrainingConfig {
    int epochs = 10;
    int batch_size = 16;
    float learning_rate = 1e-3f;
    float weight_decay = 0.01f;
    float margin = 1.0f;
    std::string loss = "margin";        // "margin" or "bradley_terry"
    double min_rating_delta = 1.0;
    uint32_t seed = 42;

    static RewardTrainingConfig from_json(const json& j);
};

struct ServiceConfig {
    std::string strategy = "auto";
    float neutral_score = 0.5f;

    static ServiceConfig from_json(const json& j);
};

// Data configuration
struct DataConfig {
    std::optional<std::string> base_specs;      // JSON array of {spec_id, prompt, spec}
    std::optional<std::string> feedback_log;    // JSON lines
    std::optional<std::string> input_spec;      // suggest / score
    std::optional<std::string> prompt;
    std::optional<std::string> output_file;
    std::string output_dir = "checkpoints";
    std::string job_spool_dir = "jobs";

    static DataConfig from_json(const json& j);
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string directory = "logs";
    bool console = true;

    static LoggingConfig from_json(const json& j);
};

// Main configuration class
class Configuration {
public:
    Configuration() = default;

    // Load configuration from JSON file
    static std::unique_ptr<Configuration> load_from_file(const std::string& filepath);

    // Parse configuration from JSON string
    static std::unique_ptr<Configuration> load_from_string(const std::string& json_str);

    // Validate configuration; logs every problem found
    bool validate() const;

    // Print configuration summary
    void print_summary() const;

    // Getters
    const ComputationConfig& get_computation_config() const { return computation_config_; }
    const EncoderConfig& get_encoder_config() const { return encoder_config_; }
    const EnvironmentConfig& get_environment_config() const { return environment_config_; }
    const RewardModelConfig& get_reward_model_config() const { return reward_model_config_; }
    const PolicyConfig& get_policy_config() const { return policy_config_; }
    const TrainingConfig& get_training_config() const { return training_config_; }
    const RewardTrainingConfig& get_reward_training_config() const { return reward_training_config_; }
    const ServiceConfig& get_service_config() const { return service_config_; }
    const DataConfig& get_data_config() const { return data_config_; }
    const LoggingConfig& get_logging_config() const { return logging_config_; }

private:
    ComputationConfig computation_config_;
    EncoderConfig encoder_config_;
    EnvironmentConfig environment_config_;
    RewardModelConfig reward_model_config_;
    PolicyConfig policy_config_;
    TrainingConfig training_config_;
    RewardTrainingConfig reward_training_config_;
    ServiceConfig service_config_;
    DataConfig data_config_;
    LoggingConfig logging_config_;

    void parse_json(const json& j);
};

} // namespace Config
} // namespace SpecOpt
