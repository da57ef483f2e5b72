#pragma once

#include "model/reward_model.hpp"
#include "spec/action_space.hpp"
#include "spec/design_spec.hpp"
#include "spec/spec_encoder.hpp"
#include "utils/logger.hpp"
#include <string>

namespace SpecOpt {
namespace Env {

enum class EnvState {
    Uninitialized,
    Ready,
    Terminal
};

enum class RewardMode {
    Score,          // reward model score of the resulting spec
    Improvement     // score delta versus the previous spec
};

RewardMode parse_reward_mode(const std::string& name);

struct EnvironmentOptions {
    int horizon = 16;
    double min_dimension = 0.01;        // metres
    double max_dimension = 12.0;
    float violation_penalty = -1.0f;
    RewardMode reward_mode = RewardMode::Score;
};

struct StepInfo {
    std::string action;     // human-readable description
    bool applied = false;
    bool degraded = false;
    std::string violation;  // empty when no hard constraint failed
    float score = 0.0f;
    int step = 0;
};

struct StepResult {
    Spec::Observation observation;
    float reward = 0.0f;
    bool terminated = false;
    bool truncated = false;
    StepInfo info;
};

/**
 * Episodic MDP over design specs.
 *
 * reset() copies the caller's spec; step() decodes an action against the
 * working copy, enforces hard constraints and scores the result with the
 * frozen reward model. Not thread-safe; one instance per worker.
 */
class SpecEnvironment {
public:
    SpecEnvironment(Model::RewardModelHandle reward_model,
                    Spec::ActionSpaceConfig action_config = Spec::ActionSpaceConfig(),
                    EnvironmentOptions options = EnvironmentOptions());

    // Validates (Utils::InvalidSpec), copies and returns the initial observation
    Spec::Observation reset(const Spec::DesignSpecification& spec, const std::string& prompt);

    // Only valid in Ready; otherwise throws Utils::InvalidState
    StepResult step(int action);

    /**
     * Hard constraint check; returns a description of the first violation
     * or an empty string
     */
    std::string check_constraints(const Spec::DesignSpecification& spec) const;

    EnvState state() const { return state_; }
    int steps_taken() const { return step_count_; }
    float current_score() const { return current_score_; }
    const Spec::DesignSpecification& current_spec() const { return spec_; }
    const std::string& prompt() const { return prompt_; }

    const Spec::ActionSpace& action_space() const { return action_space_; }
    const Spec::SpecEncoder& encoder() const { return encoder_; }
    const EnvironmentOptions& options() const { return options_; }
    int observation_size() const { return encoder_.num_buckets(); }

private:
    Model::RewardModelHandle reward_model_;
    Spec::ActionSpace action_space_;
    Spec::SpecEncoder encoder_;
    EnvironmentOptions options_;

    EnvState state_ = EnvState::Uninitialized;
    Spec::DesignSpecification spec_;
    std::string prompt_;
    Spec::Observation observation_;
    float current_score_ = 0.0f;
    int step_count_ = 0;

    Utils::ModuleLogger logger_;
};

} // namespace Env
} // namespace SpecOpt
