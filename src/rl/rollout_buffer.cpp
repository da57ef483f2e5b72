#include "rl/rollout_buffer.hpp"
#include <cmath>
#include <stdexcept>

namespace SpecOpt {
namespace RL {

RolloutBuffer::RolloutBuffer(int rollout_length, int num_envs)
    : rollout_length_(rollout_length), num_envs_(num_envs) {
    if (rollout_length_ <= 0 || num_envs_ <= 0) {
        throw std::invalid_argument("Rollout buffer dimensions must be positive");
    }
    size_t total = static_cast<size_t>(rollout_length_) * static_cast<size_t>(num_envs_);
    data_.resize(total);
    advantages_.assign(total, 0.0f);
    returns_.assign(total, 0.0f);
    last_values_.assign(static_cast<size_t>(num_envs_), 0.0f);
}

void RolloutBuffer::set(int t, int env, Transition transition) {
    if (t < 0 || t >= rollout_length_ || env < 0 || env >= num_envs_) {
        throw std::out_of_range("Rollout buffer slot out of range");
    }
    data_[index(t, env)] = std::move(transition);
}

void RolloutBuffer::set_last_value(int env, float value) {
    if (env < 0 || env >= num_envs_) {
        throw std::out_of_range("Rollout buffer env out of range");
    }
    last_values_[static_cast<size_t>(env)] = value;
}

void RolloutBuffer::compute_advantages(float gamma, float gae_lambda, bool normalize) {
    for (int env = 0; env < num_envs_; ++env) {
        float gae = 0.0f;
        for (int t = rollout_length_ - 1; t >= 0; --t) {
            size_t i = index(t, env);
            const Transition& tr = data_[i];

            float delta;
            if (tr.episode_end) {
                delta = tr.reward + gamma * tr.bootstrap_value - tr.value;
                gae = delta;
            } else {
                float next_value = (t == rollout_length_ - 1)
                                       ? last_values_[static_cast<size_t>(env)]
                                       : data_[index(t + 1, env)].value;
                delta = tr.reward + gamma * next_value - tr.value;
                gae = delta + gamma * gae_lambda * gae;
            }
            advantages_[i] = gae;
            returns_[i] = gae + tr.value;
        }
    }

    if (normalize && advantages_.size() > 1) {
        double mean = 0.0;
        for (float a : advantages_) mean += a;
        mean /= static_cast<double>(advantages_.size());

        double var = 0.0;
        for (float a : advantages_) var += (a - mean) * (a - mean);
        var /= static_cast<double>(advantages_.size());

        float inv_std = static_cast<float>(1.0 / (std::sqrt(var) + 1e-8));
        for (auto& a : advantages_) {
            a = (a - static_cast<float>(mean)) * inv_std;
        }
    }
}

float RolloutBuffer::mean_reward() const {
    double sum = 0.0;
    for (const auto& tr : data_) {
        sum += tr.reward;
    }
    return static_cast<float>(sum / static_cast<double>(data_.size()));
}

} // namespace RL
} // namespace SpecOpt
