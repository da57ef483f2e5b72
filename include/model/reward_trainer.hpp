#pragma once

#include "model/feedback.hpp"
#include "model/reward_model.hpp"
#include "utils/optimizer.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace SpecOpt {
namespace Model {

enum class PairwiseLoss {
    Margin,         // relu(margin - (r_pref - r_other))
    BradleyTerry    // -log sigmoid(r_pref - r_other)
};

PairwiseLoss parse_pairwise_loss(const std::string& name);

struct RewardTrainerOptions {
    int epochs = 10;
    int batch_size = 16;
    float learning_rate = 1e-3f;
    float weight_decay = 0.01f;
    float margin = 1.0f;
    PairwiseLoss loss = PairwiseLoss::Margin;
    double min_rating_delta = 1.0;
    uint32_t seed = 42;
};

struct RewardEpochStats {
    int epoch;
    float loss;
    float accuracy;     // share of pairs ranked correctly after the epoch
    size_t pairs;
};

/**
 * Offline pairwise trainer for the reward model (AdamW)
 */
class RewardModelTrainer {
public:
    RewardModelTrainer(RewardModel& model, RewardTrainerOptions options);

    // Converts records to pairs (skipping undecided ones) and trains
    std::vector<RewardEpochStats> train(const std::vector<FeedbackRecord>& records);
    std::vector<RewardEpochStats> train_pairs(const std::vector<PreferencePair>& pairs);

    // Fraction of pairs where the preferred spec scores strictly higher
    float evaluate_accuracy(const std::vector<PreferencePair>& pairs) const;

private:
    RewardModel& model_;
    RewardTrainerOptions options_;
    std::unique_ptr<Utils::Optimizer> optimizer_;

    float loss_and_grad(float diff, float& grad) const;
};

} // namespace Model
} // namespace SpecOpt
