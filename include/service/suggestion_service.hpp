#pragma once

#include "env/spec_env.hpp"
#include "model/policy.hpp"
#include "model/reward_model.hpp"
#include "service/heuristic_improver.hpp"
#include "spec/action_space.hpp"
#include "spec/design_spec.hpp"
#include "utils/logger.hpp"
#include <memory>
#include <string>
#include <vector>

namespace SpecOpt {
namespace Service {

enum class Strategy {
    Auto,
    PolicyRollout,
    RewardOnly,
    HeuristicFallback
};

Strategy parse_strategy(const std::string& name);
std::string strategy_name(Strategy strategy);

struct ServiceOptions {
    std::string reward_model_path;
    std::string policy_path;
    int num_buckets = Spec::SpecEncoder::DEFAULT_BUCKETS;   // encoder width both models were trained with
    float neutral_score = 0.5f;
    Spec::ActionSpaceConfig actions;
    Env::EnvironmentOptions environment;
};

struct Suggestion {
    Spec::DesignSpecification improved_spec;
    float predicted_score = 0.0f;
    Strategy strategy_used = Strategy::HeuristicFallback;
    std::string score_source;           // "reward_model" or "neutral"
    int steps = 0;
    std::vector<std::string> actions;   // applied actions or heuristic edits

    Spec::json to_json() const;
};

/**
 * Request-time improvement of a spec.
 *
 * Models are resolved once in create(); a missing or broken checkpoint is
 * logged and recorded as an absent handle, never reloaded per request.
 * suggest() is const and allocates its own environment, so concurrent calls
 * are safe.
 */
class SuggestionService {
public:
    static std::unique_ptr<SuggestionService> create(const ServiceOptions& options);

    SuggestionService(Model::RewardModelHandle reward_model,
                      std::shared_ptr<const Model::ActorCriticPolicy> policy,
                      ServiceOptions options);

    /**
     * Improve spec for prompt. policy_rollout without a policy or reward
     * model falls back to heuristic_fallback; auto picks policy_rollout when
     * it can run.
     */
    Suggestion suggest(const Spec::DesignSpecification& spec,
                       const std::string& prompt,
                       Strategy strategy = Strategy::Auto) const;

    // Parses first; malformed input throws Utils::InvalidSpec
    Suggestion suggest(const Spec::json& spec_json,
                       const std::string& prompt,
                       Strategy strategy = Strategy::Auto) const;

    // Reward model score, or the neutral score without one
    float score(const Spec::DesignSpecification& spec, const std::string& prompt) const;

    bool has_reward_model() const { return reward_model_ != nullptr; }
    bool has_policy() const { return policy_ != nullptr; }
    const ServiceOptions& options() const { return options_; }

private:
    Model::RewardModelHandle reward_model_;
    std::shared_ptr<const Model::ActorCriticPolicy> policy_;
    ServiceOptions options_;
    HeuristicImprover heuristic_;
    Utils::ModuleLogger logger_;

    Suggestion run_policy(const Spec::DesignSpecification& spec, const std::string& prompt) const;
    Suggestion run_heuristic(const Spec::DesignSpecification& spec, const std::string& prompt) const;
    Suggestion run_reward_only(const Spec::DesignSpecification& spec, const std::string& prompt) const;
};

} // namespace Service
} // namespace SpecOpt
