#pragma once

#include "env/spec_env.hpp"
#include "model/policy.hpp"
#include "model/reward_model.hpp"
#include "rl/checkpoint_store.hpp"
#include "rl/job_submitter.hpp"
#include "rl/rollout_buffer.hpp"
#include "spec/base_spec.hpp"
#include "utils/logger.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace SpecOpt {
namespace RL {

// Proximal Policy Optimization
// Based on: Schulman et al., "Proximal Policy Optimization Algorithms" (2017)
// and "High-Dimensional Continuous Control Using Generalized Advantage Estimation" (2015)
struct PPOHyperparameters {
    int rollout_length = 64;        // steps per env per update
    int n_epochs = 4;
    int minibatch_size = 64;
    float gamma = 0.99f;
    float gae_lambda = 0.95f;
    float clip_epsilon = 0.2f;
    float value_coef = 0.5f;
    float entropy_coef = 0.01f;
    float max_grad_norm = 0.5f;
    float learning_rate = 3e-4f;
    bool normalize_advantages = true;
    int hidden_dim = Model::ActorCriticPolicy::DEFAULT_HIDDEN;
    uint32_t seed = 42;

    nlohmann::json to_json() const;
};

struct TrainerOptions {
    std::string output_dir = "checkpoints";
    int checkpoint_every = 10;              // updates
    int keep_checkpoints = 0;               // 0 keeps every periodic checkpoint
    bool resume = false;
    uint64_t local_step_threshold = 100000;
    std::string job_spool_dir = "jobs";
    int num_threads = 0;                    // 0 = one per env, capped at hardware
    std::string reward_model_path;          // for error messages and job requests
    Spec::ActionSpaceConfig actions;
    Env::EnvironmentOptions environment;
};

// Cooperative stop flag, checked between updates
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

struct UpdateStats {
    int update = 0;
    uint64_t steps = 0;
    float mean_reward = 0.0f;
    float mean_episode_return = 0.0f;
    int episodes = 0;
    float policy_loss = 0.0f;
    float value_loss = 0.0f;
    float entropy = 0.0f;
    float approx_kl = 0.0f;
    float clip_fraction = 0.0f;
    float grad_norm = 0.0f;
};

struct TrainOutcome {
    std::string checkpoint_path;    // local run
    std::string job_handle;         // routed to the scheduler
    int updates_completed = 0;
    uint64_t steps_completed = 0;
    std::vector<UpdateStats> history;

    bool is_job() const { return !job_handle.empty(); }
};

/**
 * Clipped-objective actor-critic trainer over vectorized SpecEnvironments.
 *
 * Rollouts run one env per worker on a ThreadPool with the policy read-only;
 * the update itself runs on the calling thread.
 */
class PPOTrainer {
public:
    using ProgressCallback = std::function<void(const UpdateStats&)>;

    PPOTrainer(Model::RewardModelHandle reward_model,
               TrainerOptions options,
               std::shared_ptr<JobSubmitter> submitter = nullptr);

    /**
     * Train for `steps` environment steps across env_count environments.
     *
     * Throws Utils::ModelUnavailable before anything else when there is no
     * reward model, Utils::InvalidSpec when every base spec is malformed and
     * Utils::TrainingInterrupted when the token is cancelled.
     */
    TrainOutcome train(const std::vector<Spec::BaseSpec>& base_specs,
                       uint64_t steps,
                       int env_count,
                       const PPOHyperparameters& hyperparameters,
                       const CancellationToken* cancel = nullptr);

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // Policy of the most recent local run; null before the first one
    const Model::ActorCriticPolicy* policy() const { return policy_.get(); }

    const TrainerOptions& options() const { return options_; }

private:
    Model::RewardModelHandle reward_model_;
    TrainerOptions options_;
    std::shared_ptr<JobSubmitter> submitter_;
    ProgressCallback progress_callback_;
    std::unique_ptr<Model::ActorCriticPolicy> policy_;
    Utils::ModuleLogger logger_;

    std::string submit_job(const std::vector<Spec::BaseSpec>& base_specs,
                           uint64_t steps,
                           int env_count,
                           const PPOHyperparameters& hyperparameters);
};

} // namespace RL
} // namespace SpecOpt
