#include "executor/pipeline_executor.hpp"
#include "model/feedback.hpp"
#include "spec/base_spec.hpp"
#include "utils/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <omp.h>

namespace SpecOpt {
namespace Executor {

Spec::ActionSpaceConfig make_action_space_config(const Config::EnvironmentConfig& env) {
    Spec::ActionSpaceConfig actions;
    actions.max_objects = env.max_objects;
    if (env.material_palette) actions.material_palette = *env.material_palette;
    if (env.resize_factors) actions.resize_factors = *env.resize_factors;
    if (env.addable_types) actions.addable_types = *env.addable_types;
    return actions;
}

Env::EnvironmentOptions make_environment_options(const Config::EnvironmentConfig& env) {
    Env::EnvironmentOptions options;
    options.horizon = env.horizon;
    options.min_dimension = env.min_dimension;
    options.max_dimension = env.max_dimension;
    options.violation_penalty = env.violation_penalty;
    options.reward_mode = Env::parse_reward_mode(env.reward_mode);
    return options;
}

RL::PPOHyperparameters make_hyperparameters(const Config::TrainingConfig& training,
                                            const Config::PolicyConfig& policy) {
    RL::PPOHyperparameters hp;
    hp.rollout_length = training.rollout_length;
    hp.n_epochs = training.n_epochs;
    hp.minibatch_size = training.minibatch_size;
    hp.gamma = training.gamma;
    hp.gae_lambda = training.gae_lambda;
    hp.clip_epsilon = training.clip_epsilon;
    hp.value_coef = training.value_coef;
    hp.entropy_coef = training.entropy_coef;
    hp.max_grad_norm = training.max_grad_norm;
    hp.learning_rate = training.learning_rate;
    hp.normalize_advantages = training.normalize_advantages;
    hp.hidden_dim = policy.hidden_dim;
    hp.seed = training.seed;
    return hp;
}

RL::TrainerOptions make_trainer_options(const Config::Configuration& config) {
    const auto& training = config.get_training_config();
    const auto& data = config.get_data_config();

    RL::TrainerOptions options;
    options.output_dir = data.output_dir;
    options.job_spool_dir = data.job_spool_dir;
    options.checkpoint_every = training.checkpoint_every;
    options.keep_checkpoints = training.keep_checkpoints;
    options.resume = training.resume;
    options.local_step_threshold = training.local_step_threshold;
    options.num_threads = training.num_threads.value_or(0);
    options.reward_model_path = config.get_reward_model_config().checkpoint.value_or("");
    options.actions = make_action_space_config(config.get_environment_config());
    options.environment = make_environment_options(config.get_environment_config());
    return options;
}

Model::RewardTrainerOptions make_reward_trainer_options(const Config::RewardTrainingConfig& rt) {
    Model::RewardTrainerOptions options;
    options.epochs = rt.epochs;
    options.batch_size = rt.batch_size;
    options.learning_rate = rt.learning_rate;
    options.weight_decay = rt.weight_decay;
    options.margin = rt.margin;
    options.loss = Model::parse_pairwise_loss(rt.loss);
    options.min_rating_delta = rt.min_rating_delta;
    options.seed = rt.seed;
    return options;
}

Service::ServiceOptions make_service_options(const Config::Configuration& config) {
    Service::ServiceOptions options;
    options.reward_model_path = config.get_reward_model_config().checkpoint.value_or("");
    options.policy_path = config.get_policy_config().checkpoint.value_or("");
    options.num_buckets = config.get_encoder_config().num_buckets;
    options.neutral_score = config.get_service_config().neutral_score;
    options.actions = make_action_space_config(config.get_environment_config());
    options.environment = make_environment_options(config.get_environment_config());
    return options;
}

void apply_runtime_settings(const Config::Configuration& config) {
    const auto& logging = config.get_logging_config();
    auto& log = Utils::Logger::instance();
    log.set_log_directory(logging.directory);
    log.set_min_level(Utils::parse_log_level(logging.level));
    log.set_console_output(logging.console);

    const auto& computation = config.get_computation_config();
    if (computation.omp_threads && *computation.omp_threads > 0) {
        omp_set_num_threads(*computation.omp_threads);
    }
}

PipelineExecutor::PipelineExecutor(const Config::Configuration& config)
    : config_(config), logger_("EXECUTOR"), status_("initialized") {
}

void PipelineExecutor::execute() {
    logger_.info("=== Starting Pipeline Execution ===");

    const auto& comp_config = config_.get_computation_config();
    logger_.info("Mode: " + comp_config.mode);
    logger_.info("");

    status_ = "running";

    try {
        if (comp_config.mode == "train_policy") {
            run_train_policy();
        } else if (comp_config.mode == "train_reward") {
            run_train_reward();
        } else if (comp_config.mode == "suggest") {
            run_suggest();
        } else if (comp_config.mode == "score") {
            run_score();
        } else {
            throw std::runtime_error("Invalid computation mode: " + comp_config.mode);
        }

        status_ = "completed";
        logger_.info("=== Pipeline Execution Completed Successfully ===");
    } catch (const Utils::TrainingInterrupted& e) {
        status_ = "interrupted";
        logger_.warning(e.what());
        throw;
    } catch (const std::exception& e) {
        status_ = "failed";
        logger_.error("Execution failed: " + std::string(e.what()));
        throw;
    }
}

void PipelineExecutor::run_train_policy() {
    const auto& data = config_.get_data_config();
    const auto& training = config_.get_training_config();
    const std::string reward_path = config_.get_reward_model_config().checkpoint.value_or("");

    // Fails with ModelUnavailable before any environment exists
    Model::RewardModelHandle reward_model =
        Model::RewardModel::load(reward_path, config_.get_encoder_config().num_buckets);

    auto base_specs = Spec::load_base_specs(data.base_specs.value());
    logger_.info("Loaded " + std::to_string(base_specs.size()) + " base specs from " + *data.base_specs);

    RL::PPOTrainer trainer(reward_model, make_trainer_options(config_));
    train_outcome_ = trainer.train(base_specs, training.steps, training.env_count,
                                   make_hyperparameters(training, config_.get_policy_config()),
                                   &cancel_);

    Spec::json result;
    if (train_outcome_.is_job()) {
        logger_.info("Submitted as job " + train_outcome_.job_handle);
        result["job_handle"] = train_outcome_.job_handle;
    } else {
        logger_.info("Policy checkpoint: " + train_outcome_.checkpoint_path);
        result["checkpoint_path"] = train_outcome_.checkpoint_path;
        result["updates"] = train_outcome_.updates_completed;
        result["steps"] = train_outcome_.steps_completed;
        if (!train_outcome_.history.empty()) {
            result["final_mean_reward"] = train_outcome_.history.back().mean_reward;
        }
    }
    write_output(result);
}

void PipelineExecutor::run_train_reward() {
    const auto& rm_config = config_.get_reward_model_config();
    const std::string path = rm_config.checkpoint.value();
    const int buckets = config_.get_encoder_config().num_buckets;

    std::unique_ptr<Model::RewardModel> model;
    if (std::filesystem::exists(path)) {
        model = Model::RewardModel::load(path, buckets);
    } else if (rm_config.initialize_if_missing) {
        logger_.info("No reward model at " + path + "; initializing a new one");
        model = std::make_unique<Model::RewardModel>(buckets, rm_config.hidden_dim);
        model->initialize(rm_config.seed);
    } else {
        throw Utils::ModelUnavailable(path, "checkpoint not found (set reward_model.initialize_if_missing)");
    }

    Model::FeedbackLog log(config_.get_data_config().feedback_log.value());
    auto records = log.read_all();

    Model::RewardModelTrainer trainer(*model, make_reward_trainer_options(config_.get_reward_training_config()));
    auto history = trainer.train(records);
    model->save(path);

    Spec::json result;
    result["checkpoint_path"] = path;
    result["records"] = records.size();
    if (!history.empty()) {
        result["final_loss"] = history.back().loss;
        result["pair_accuracy"] = history.back().accuracy;
        result["pairs"] = history.back().pairs;
    }
    write_output(result);
}

void PipelineExecutor::run_suggest() {
    const auto& data = config_.get_data_config();
    auto spec = Spec::DesignSpecification::load_from_file(data.input_spec.value());
    auto service = Service::SuggestionService::create(make_service_options(config_));

    Service::Strategy strategy = Service::parse_strategy(config_.get_service_config().strategy);
    suggestion_ = service->suggest(spec, data.prompt.value_or(""), strategy);

    logger_.info("Strategy used: " + Service::strategy_name(suggestion_.strategy_used) +
                 ", predicted score " + std::to_string(suggestion_.predicted_score) +
                 " (" + suggestion_.score_source + ")");
    write_output(suggestion_.to_json());
}

void PipelineExecutor::run_score() {
    const auto& data = config_.get_data_config();
    auto spec = Spec::DesignSpecification::load_from_file(data.input_spec.value());
    auto service = Service::SuggestionService::create(make_service_options(config_));

    score_ = service->score(spec, data.prompt.value_or(""));
    logger_.info("Score: " + std::to_string(score_));

    Spec::json result;
    result["score"] = score_;
    result["score_source"] = service->has_reward_model() ? "reward_model" : "neutral";
    write_output(result);
}

void PipelineExecutor::write_output(const Spec::json& result) const {
    const auto& output_file = config_.get_data_config().output_file;
    if (!output_file) {
        std::cout << result.dump(2) << std::endl;
        return;
    }

    std::filesystem::path target(*output_file);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::ofstream out(*output_file);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write output file: " + *output_file);
    }
    out << result.dump(2) << "\n";
    logger_.info("Wrote result to " + *output_file);
}

} // namespace Executor
} // namespace SpecOpt
