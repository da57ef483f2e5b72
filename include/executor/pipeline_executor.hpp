#pragma once

#include "config/configuration.hpp"
#include "env/spec_env.hpp"
#include "rl/ppo_trainer.hpp"
#include "model/reward_trainer.hpp"
#include "service/suggestion_service.hpp"
#include "spec/action_space.hpp"
#include "utils/logger.hpp"
#include <string>

namespace SpecOpt {
namespace Executor {

// Config section -> component option mapping
Spec::ActionSpaceConfig make_action_space_config(const Config::EnvironmentConfig& env);
Env::EnvironmentOptions make_environment_options(const Config::EnvironmentConfig& env);
RL::PPOHyperparameters make_hyperparameters(const Config::TrainingConfig& training,
                                            const Config::PolicyConfig& policy);
RL::TrainerOptions make_trainer_options(const Config::Configuration& config);
Model::RewardTrainerOptions make_reward_trainer_options(const Config::RewardTrainingConfig& rt);
Service::ServiceOptions make_service_options(const Config::Configuration& config);

// Logger directory, level and console output; OpenMP thread count
void apply_runtime_settings(const Config::Configuration& config);

// Runs the computation selected by computation.mode
class PipelineExecutor {
public:
    explicit PipelineExecutor(const Config::Configuration& config);

    // Execute the configured computation
    void execute();

    // Get status of execution
    std::string get_status() const { return status_; }

    // Cancel a running train_policy between updates (e.g. from a signal handler)
    RL::CancellationToken& cancellation_token() { return cancel_; }

    const RL::TrainOutcome& last_train_outcome() const { return train_outcome_; }
    const Service::Suggestion& last_suggestion() const { return suggestion_; }
    float last_score() const { return score_; }

private:
    const Config::Configuration& config_;
    Utils::ModuleLogger logger_;
    std::string status_;
    RL::CancellationToken cancel_;

    RL::TrainOutcome train_outcome_;
    Service::Suggestion suggestion_;
    float score_ = 0.0f;

    void run_train_policy();
    void run_train_reward();
    void run_suggest();
    void run_score();

    void write_output(const Spec::json& result) const;
};

} // namespace Executor
} // namespace SpecOpt
