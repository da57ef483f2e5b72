#include "env/spec_env.hpp"
#include "utils/errors.hpp"
#include <sstream>
#include <stdexcept>

namespace SpecOpt {
namespace Env {

RewardMode parse_reward_mode(const std::string& name) {
    if (name == "score") return RewardMode::Score;
    if (name == "improvement") return RewardMode::Improvement;
    throw std::invalid_argument("Unknown reward mode: " + name);
}

SpecEnvironment::SpecEnvironment(Model::RewardModelHandle reward_model,
                                 Spec::ActionSpaceConfig action_config,
                                 EnvironmentOptions options)
    : reward_model_(std::move(reward_model)),
      action_space_(std::move(action_config)),
      encoder_(reward_model_ ? reward_model_->input_dim() : Spec::SpecEncoder::DEFAULT_BUCKETS),
      options_(options),
      logger_("ENV") {
    if (!reward_model_) {
        throw Utils::ModelUnavailable("", "environment requires a reward model");
    }
    if (options_.horizon <= 0) {
        throw std::invalid_argument("Environment horizon must be positive");
    }
}

Spec::Observation SpecEnvironment::reset(const Spec::DesignSpecification& spec, const std::string& prompt) {
    spec.validate();

    spec_ = spec;
    prompt_ = prompt;
    step_count_ = 0;
    observation_ = encoder_.encode(prompt_, spec_);
    current_score_ = reward_model_->score_observation(observation_);
    state_ = EnvState::Ready;

    logger_.debug("reset: " + std::to_string(spec_.object_count()) + " objects, score " +
                  std::to_string(current_score_));
    return observation_;
}

std::string SpecEnvironment::check_constraints(const Spec::DesignSpecification& spec) const {
    if (static_cast<int>(spec.object_count()) > action_space_.config().max_objects) {
        return "object count " + std::to_string(spec.object_count()) + " exceeds " +
               std::to_string(action_space_.config().max_objects);
    }

    for (const auto& obj : spec.objects()) {
        const auto& d = obj.dimensions;
        for (double extent : {d.width, d.depth, d.height}) {
            if (extent > 0.0 && (extent < options_.min_dimension || extent > options_.max_dimension)) {
                std::ostringstream oss;
                oss << obj.id << " dimension " << extent << " outside ["
                    << options_.min_dimension << ", " << options_.max_dimension << "]";
                return oss.str();
            }
        }
    }

    const auto& scene = spec.scene();
    if (scene.budget > 0.0 && scene.estimated_cost > scene.budget) {
        std::ostringstream oss;
        oss << "estimated cost " << scene.estimated_cost << " exceeds budget " << scene.budget;
        return oss.str();
    }
    return std::string();
}

StepResult SpecEnvironment::step(int action) {
    if (state_ != EnvState::Ready) {
        throw Utils::InvalidState(state_ == EnvState::Uninitialized
                                      ? "step() called before reset()"
                                      : "step() called on a finished episode; call reset()");
    }

    Spec::MutatedSpec mutated = action_space_.decode(action, spec_);
    ++step_count_;

    StepResult result;
    result.info.action = action_space_.describe(mutated.action);
    result.info.applied = mutated.applied;
    result.info.degraded = mutated.degraded;
    result.info.step = step_count_;

    const float previous_score = current_score_;

    if (mutated.action.kind == Spec::ActionKind::NoOp) {
        result.terminated = true;
    } else {
        std::string violation = check_constraints(mutated.spec);
        if (!violation.empty()) {
            // The violating edit is discarded; the episode ends on the last valid spec
            result.info.violation = violation;
            result.terminated = true;
            result.reward = (options_.reward_mode == RewardMode::Score ? previous_score : 0.0f) +
                            options_.violation_penalty;
            result.info.score = previous_score;
            result.observation = observation_;
            state_ = EnvState::Terminal;
            logger_.debug("violation: " + violation);
            return result;
        }
        spec_ = std::move(mutated.spec);
        observation_ = encoder_.encode(prompt_, spec_);
        current_score_ = reward_model_->score_observation(observation_);
    }

    result.observation = observation_;
    result.info.score = current_score_;
    result.reward = options_.reward_mode == RewardMode::Score ? current_score_
                                                                : current_score_ - previous_score;
    result.truncated = !result.terminated && step_count_ >= options_.horizon;

    if (result.terminated || result.truncated) {
        state_ = EnvState::Terminal;
    }
    return result;
}

} // namespace Env
} // namespace SpecOpt
