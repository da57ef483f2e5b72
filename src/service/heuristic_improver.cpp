#include "service/heuristic_improver.hpp"
#include "utils/logger.hpp"
#include <optional>

namespace SpecOpt {
namespace Service {

HeuristicImprover::HeuristicImprover(const Spec::MaterialCatalog& catalog) : catalog_(catalog) {
}

bool HeuristicImprover::affordable(const Spec::DesignSpecification& candidate, double current_cost) const {
    const auto& scene = candidate.scene();
    return scene.budget <= 0.0 || scene.estimated_cost <= scene.budget || scene.estimated_cost <= current_cost;
}

HeuristicResult HeuristicImprover::improve(const Spec::DesignSpecification& spec,
                                           const std::string& prompt,
                                           const Model::RewardModel* reward_model,
                                           float neutral_score) const {
    HeuristicResult result;
    result.spec = spec;
    result.scored = reward_model != nullptr;
    result.score = reward_model ? reward_model->score(prompt, result.spec) : neutral_score;
    const float baseline = result.score;

    // Score a candidate; false when it breaks the budget or scores below the input
    auto evaluate = [&](Spec::DesignSpecification& candidate, const std::string& description, float& score) {
        candidate.scene().estimated_cost = catalog_.estimate_cost(candidate);
        if (!affordable(candidate, catalog_.estimate_cost(result.spec))) {
            LOG_DEBUG("HEURISTIC", "rejected " + description + ": over budget");
            return false;
        }
        score = reward_model ? reward_model->score(prompt, candidate) : neutral_score;
        if (score < baseline) {
            LOG_DEBUG("HEURISTIC", "rejected " + description + ": score " +
                      std::to_string(score) + " < " + std::to_string(baseline));
            return false;
        }
        return true;
    };

    for (size_t i = 0; i < result.spec.object_count(); ++i) {
        const Spec::DesignObject obj = result.spec.objects()[i];
        const std::string fill_color = obj.color.empty() ? catalog_.defaults_for(obj.type).color : "";
        const std::string color_edit = obj.id + ".color -> " + fill_color;

        // Every upgrade option, alone and with the color fill; the best survivor wins
        std::optional<Spec::DesignSpecification> best;
        float best_score = 0.0f;
        std::vector<std::string> best_edits;
        for (const auto& material : catalog_.upgrade_options(obj.material, obj.type)) {
            const std::string material_edit = obj.id + ".material " + obj.material + " -> " + material;
            for (bool with_color : {false, true}) {
                if (with_color && fill_color.empty()) {
                    continue;
                }
                Spec::DesignSpecification candidate = result.spec;
                candidate.objects()[i].material = material;
                if (with_color) {
                    candidate.objects()[i].color = fill_color;
                }
                float score = 0.0f;
                if (!evaluate(candidate, material_edit, score) || (best && score <= best_score)) {
                    continue;
                }
                best = std::move(candidate);
                best_score = score;
                best_edits = {material_edit};
                if (with_color) {
                    best_edits.push_back(color_edit);
                }
            }
        }
        if (best) {
            result.spec = std::move(*best);
            result.score = best_score;
            result.edits.insert(result.edits.end(), best_edits.begin(), best_edits.end());
        }

        if (!fill_color.empty() && result.spec.objects()[i].color.empty()) {
            Spec::DesignSpecification candidate = result.spec;
            candidate.objects()[i].color = fill_color;
            float score = 0.0f;
            if (evaluate(candidate, color_edit, score)) {
                result.spec = std::move(candidate);
                result.score = score;
                result.edits.push_back(color_edit);
            }
        }
    }

    return result;
}

} // namespace Service
} // namespace SpecOpt
