#include "model/reward_trainer.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

namespace SpecOpt {
namespace Model {

PairwiseLoss parse_pairwise_loss(const std::string& name) {
    if (name == "margin") return PairwiseLoss::Margin;
    if (name == "bradley_terry" || name == "bt") return PairwiseLoss::BradleyTerry;
    throw std::invalid_argument("Unknown pairwise loss: " + name);
}

RewardModelTrainer::RewardModelTrainer(RewardModel& model, RewardTrainerOptions options)
    : model_(model), options_(options) {
    if (options_.batch_size <= 0 || options_.epochs < 0) {
        throw std::invalid_argument("Reward trainer needs a positive batch size and non-negative epochs");
    }
    optimizer_ = Utils::OptimizerFactory::create(
        Utils::OptimizerFactory::Type::AdamW, options_.learning_rate, options_.weight_decay);
}

float RewardModelTrainer::loss_and_grad(float diff, float& grad) const {
    if (options_.loss == PairwiseLoss::Margin) {
        float slack = options_.margin - diff;
        if (slack > 0.0f) {
            grad = -1.0f;
            return slack;
        }
        grad = 0.0f;
        return 0.0f;
    }

    // softplus(-diff), computed without overflow
    float sig = 1.0f / (1.0f + std::exp(-diff));
    grad = sig - 1.0f;
    return diff > 0.0f ? std::log1p(std::exp(-diff)) : -diff + std::log1p(std::exp(diff));
}

std::vector<RewardEpochStats> RewardModelTrainer::train(const std::vector<FeedbackRecord>& records) {
    std::vector<PreferencePair> pairs;
    pairs.reserve(records.size());
    for (const auto& record : records) {
        auto pair = to_preference_pair(record, options_.min_rating_delta);
        if (pair) {
            pairs.push_back(std::move(*pair));
        }
    }
    LOG_INFO("REWARD_TRAINER", std::to_string(pairs.size()) + " preference pairs from " +
             std::to_string(records.size()) + " feedback records");
    return train_pairs(pairs);
}

std::vector<RewardEpochStats> RewardModelTrainer::train_pairs(const std::vector<PreferencePair>& pairs) {
    std::vector<RewardEpochStats> history;
    if (pairs.empty()) {
        LOG_WARNING("REWARD_TRAINER", "No usable preference pairs; reward model left unchanged");
        return history;
    }

    const size_t k = static_cast<size_t>(model_.input_dim());
    const auto& encoder = model_.encoder();

    // Encode once; observations do not change across epochs
    std::vector<Spec::Observation> preferred_obs;
    std::vector<Spec::Observation> other_obs;
    preferred_obs.reserve(pairs.size());
    other_obs.reserve(pairs.size());
    for (const auto& pair : pairs) {
        preferred_obs.push_back(encoder.encode(pair.prompt, pair.preferred));
        other_obs.push_back(encoder.encode(pair.prompt, pair.other));
    }

    std::vector<size_t> order(pairs.size());
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 gen(options_.seed);
    auto params = model_.parameters();

    for (int epoch = 1; epoch <= options_.epochs; ++epoch) {
        std::shuffle(order.begin(), order.end(), gen);
        double epoch_loss = 0.0;

        for (size_t start = 0; start < order.size(); start += static_cast<size_t>(options_.batch_size)) {
            size_t end = std::min(order.size(), start + static_cast<size_t>(options_.batch_size));
            size_t batch = end - start;

            auto x_pref = Math::MatrixFactory::zeros(batch, k);
            auto x_other = Math::MatrixFactory::zeros(batch, k);
            for (size_t b = 0; b < batch; ++b) {
                size_t idx = order[start + b];
                std::copy(preferred_obs[idx].begin(), preferred_obs[idx].end(), x_pref->data() + b * k);
                std::copy(other_obs[idx].begin(), other_obs[idx].end(), x_other->data() + b * k);
            }

            RewardForwardCache cache_pref;
            RewardForwardCache cache_other;
            auto r_pref = model_.forward(*x_pref, &cache_pref);
            auto r_other = model_.forward(*x_other, &cache_other);

            auto grad_pref = Math::MatrixFactory::zeros(batch, 1);
            auto grad_other = Math::MatrixFactory::zeros(batch, 1);
            const float inv_batch = 1.0f / static_cast<float>(batch);

            for (size_t b = 0; b < batch; ++b) {
                float diff = r_pref->at(b, 0) - r_other->at(b, 0);
                float grad = 0.0f;
                epoch_loss += loss_and_grad(diff, grad);
                grad_pref->at(b, 0) = grad * inv_batch;
                grad_other->at(b, 0) = -grad * inv_batch;
            }

            optimizer_->zero_grad(params);
            model_.backward(cache_pref, *grad_pref);
            model_.backward(cache_other, *grad_other);
            optimizer_->step(params);
        }

        RewardEpochStats stats;
        stats.epoch = epoch;
        stats.loss = static_cast<float>(epoch_loss / static_cast<double>(pairs.size()));
        stats.accuracy = evaluate_accuracy(pairs);
        stats.pairs = pairs.size();
        history.push_back(stats);

        std::ostringstream oss;
        oss << "Epoch " << epoch << "/" << options_.epochs
            << " loss=" << stats.loss << " pair_accuracy=" << stats.accuracy;
        LOG_INFO("REWARD_TRAINER", oss.str());
    }

    return history;
}

float RewardModelTrainer::evaluate_accuracy(const std::vector<PreferencePair>& pairs) const {
    if (pairs.empty()) {
        return 0.0f;
    }
    size_t correct = 0;
    for (const auto& pair : pairs) {
        if (model_.score(pair.prompt, pair.preferred) > model_.score(pair.prompt, pair.other)) {
            ++correct;
        }
    }
    return static_cast<float>(correct) / static_cast<float>(pairs.size());
}

} // namespace Model
} // namespace SpecOpt
