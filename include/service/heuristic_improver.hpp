#pragma once

#include "model/reward_model.hpp"
#include "spec/design_spec.hpp"
#include "spec/material_catalog.hpp"
#include <string>
#include <vector>

namespace SpecOpt {
namespace Service {

struct HeuristicResult {
    Spec::DesignSpecification spec;
    float score = 0.0f;
    bool scored = false;                    // score came from a reward model
    std::vector<std::string> edits;         // accepted edits, in order
};

/**
 * Rule-based improver used when no trained policy is available.
 *
 * Per object in order: try every better material (higher tiers of the
 * family, then the type's premium default), each alone and together with
 * the type's default color when the color is empty, and keep the best
 * candidate. Failing that, fill the empty color alone. Estimated cost is
 * recomputed for every candidate. Under a positive budget a candidate must
 * fit the budget or at least not cost more than the spec it replaces.
 *
 * With a reward model a candidate is kept only if it scores no lower than
 * the input, so the result never scores below the input.
 */
class HeuristicImprover {
public:
    explicit HeuristicImprover(const Spec::MaterialCatalog& catalog = Spec::MaterialCatalog::builtin());

    HeuristicResult improve(const Spec::DesignSpecification& spec,
                            const std::string& prompt,
                            const Model::RewardModel* reward_model,
                            float neutral_score) const;

private:
    const Spec::MaterialCatalog& catalog_;

    bool affordable(const Spec::DesignSpecification& candidate, double current_cost) const;
};

} // namespace Service
} // namespace SpecOpt
