#include "service/suggestion_service.hpp"
#include "utils/errors.hpp"
#include <stdexcept>

namespace SpecOpt {
namespace Service {

Strategy parse_strategy(const std::string& name) {
    if (name == "auto") return Strategy::Auto;
    if (name == "policy_rollout") return Strategy::PolicyRollout;
    if (name == "reward_only") return Strategy::RewardOnly;
    if (name == "heuristic_fallback") return Strategy::HeuristicFallback;
    throw std::invalid_argument("Unknown strategy: " + name);
}

std::string strategy_name(Strategy strategy) {
    switch (strategy) {
        case Strategy::Auto: return "auto";
        case Strategy::PolicyRollout: return "policy_rollout";
        case Strategy::RewardOnly: return "reward_only";
        case Strategy::HeuristicFallback: return "heuristic_fallback";
    }
    return "unknown";
}

Spec::json Suggestion::to_json() const {
    return Spec::json{
        {"improved_spec", improved_spec.to_json()},
        {"predicted_score", predicted_score},
        {"strategy_used", strategy_name(strategy_used)},
        {"score_source", score_source},
        {"steps", steps},
        {"actions", actions}
    };
}

std::unique_ptr<SuggestionService> SuggestionService::create(const ServiceOptions& options) {
    Utils::ModuleLogger logger("SUGGEST");

    Model::RewardModelHandle reward_model;
    if (!options.reward_model_path.empty()) {
        try {
            reward_model = Model::RewardModel::load(options.reward_model_path, options.num_buckets);
        } catch (const Utils::ModelUnavailable& e) {
            logger.warning(std::string(e.what()) + "; scoring falls back to the neutral score");
        }
    } else {
        logger.info("No reward model configured");
    }

    std::shared_ptr<const Model::ActorCriticPolicy> policy;
    if (!options.policy_path.empty()) {
        const int obs_dim = options.num_buckets;
        const int action_dim = Spec::ActionSpace(options.actions).size();
        try {
            policy = Model::ActorCriticPolicy::load(options.policy_path, obs_dim, action_dim);
        } catch (const Utils::ModelUnavailable& e) {
            logger.warning(std::string(e.what()) + "; policy_rollout will use the heuristic fallback");
        }
    } else {
        logger.info("No policy configured");
    }

    return std::make_unique<SuggestionService>(std::move(reward_model), std::move(policy), options);
}

SuggestionService::SuggestionService(Model::RewardModelHandle reward_model,
                                     std::shared_ptr<const Model::ActorCriticPolicy> policy,
                                     ServiceOptions options)
    : reward_model_(std::move(reward_model)),
      policy_(std::move(policy)),
      options_(std::move(options)),
      logger_("SUGGEST") {
    if (policy_ && reward_model_) {
        const int action_dim = Spec::ActionSpace(options_.actions).size();
        if (policy_->obs_dim() != reward_model_->input_dim() || policy_->action_dim() != action_dim) {
            logger_.warning("Policy shape does not match the encoder/action space; ignoring it");
            policy_.reset();
        }
    }
    logger_.info(std::string("Ready: reward model ") + (reward_model_ ? "loaded" : "absent") +
                 ", policy " + (policy_ ? "loaded" : "absent"));
}

float SuggestionService::score(const Spec::DesignSpecification& spec, const std::string& prompt) const {
    return reward_model_ ? reward_model_->score(prompt, spec) : options_.neutral_score;
}

Suggestion SuggestionService::suggest(const Spec::json& spec_json,
                                      const std::string& prompt,
                                      Strategy strategy) const {
    return suggest(Spec::DesignSpecification::from_json(spec_json, "request"), prompt, strategy);
}

Suggestion SuggestionService::suggest(const Spec::DesignSpecification& spec,
                                      const std::string& prompt,
                                      Strategy strategy) const {
    spec.validate("request");

    const bool can_roll_out = policy_ && reward_model_;
    switch (strategy) {
        case Strategy::Auto:
        case Strategy::PolicyRollout:
            if (can_roll_out) {
                return run_policy(spec, prompt);
            }
            if (strategy == Strategy::PolicyRollout) {
                logger_.info("policy_rollout unavailable; using heuristic_fallback");
            }
            return run_heuristic(spec, prompt);
        case Strategy::RewardOnly:
            return run_reward_only(spec, prompt);
        case Strategy::HeuristicFallback:
            return run_heuristic(spec, prompt);
    }
    return run_heuristic(spec, prompt);
}

Suggestion SuggestionService::run_policy(const Spec::DesignSpecification& spec, const std::string& prompt) const {
    Env::SpecEnvironment env(reward_model_, options_.actions, options_.environment);
    Spec::Observation obs = env.reset(spec, prompt);

    Suggestion suggestion;
    suggestion.strategy_used = Strategy::PolicyRollout;
    suggestion.score_source = "reward_model";

    while (env.state() == Env::EnvState::Ready) {
        int action = policy_->act_greedy(obs);
        Env::StepResult result = env.step(action);
        suggestion.steps++;
        if (result.info.applied) {
            suggestion.actions.push_back(result.info.action);
        }
        obs = std::move(result.observation);
    }

    suggestion.improved_spec = env.current_spec();
    suggestion.predicted_score = env.current_score();
    logger_.debug("policy rollout: " + std::to_string(suggestion.steps) + " steps, score " +
                  std::to_string(suggestion.predicted_score));
    return suggestion;
}

Suggestion SuggestionService::run_heuristic(const Spec::DesignSpecification& spec, const std::string& prompt) const {
    HeuristicResult result = heuristic_.improve(spec, prompt, reward_model_.get(), options_.neutral_score);

    Suggestion suggestion;
    suggestion.improved_spec = std::move(result.spec);
    suggestion.predicted_score = result.score;
    suggestion.strategy_used = Strategy::HeuristicFallback;
    suggestion.score_source = result.scored ? "reward_model" : "neutral";
    suggestion.steps = static_cast<int>(result.edits.size());
    suggestion.actions = std::move(result.edits);
    return suggestion;
}

Suggestion SuggestionService::run_reward_only(const Spec::DesignSpecification& spec, const std::string& prompt) const {
    Suggestion suggestion;
    suggestion.improved_spec = spec;
    suggestion.predicted_score = score(spec, prompt);
    suggestion.strategy_used = Strategy::RewardOnly;
    suggestion.score_source = reward_model_ ? "reward_model" : "neutral";
    return suggestion;
}

} // namespace Service
} // namespace SpecOpt
