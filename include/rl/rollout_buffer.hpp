#pragma once

#include "spec/spec_encoder.hpp"
#include <cstddef>
#include <vector>

namespace SpecOpt {
namespace RL {

struct Transition {
    Spec::Observation observation;
    int action = 0;
    float log_prob = 0.0f;
    float value = 0.0f;
    float reward = 0.0f;
    bool episode_end = false;       // terminated or truncated after this step
    float bootstrap_value = 0.0f;   // V(s') for truncated ends, 0 for terminal ones
};

/**
 * Fixed-size (rollout_length x num_envs) storage for one rollout.
 *
 * Slots are preallocated so workers can write their own env column
 * concurrently without locking.
 */
class RolloutBuffer {
public:
    RolloutBuffer(int rollout_length, int num_envs);

    void set(int t, int env, Transition transition);
    const Transition& at(int t, int env) const { return data_[index(t, env)]; }

    // Value of the observation following the last stored step of each env
    void set_last_value(int env, float value);

    /**
     * Generalized advantage estimation per env column, walking backwards
     * and cutting the trace at episode ends.
     */
    void compute_advantages(float gamma, float gae_lambda, bool normalize);

    size_t size() const { return data_.size(); }
    int rollout_length() const { return rollout_length_; }
    int num_envs() const { return num_envs_; }

    // Flat views, index = t * num_envs + env
    const Transition& transition(size_t i) const { return data_[i]; }
    float advantage(size_t i) const { return advantages_[i]; }
    float return_at(size_t i) const { return returns_[i]; }

    float mean_reward() const;

private:
    int rollout_length_;
    int num_envs_;
    std::vector<Transition> data_;
    std::vector<float> last_values_;
    std::vector<float> advantages_;
    std::vector<float> returns_;

    size_t index(int t, int env) const {
        return static_cast<size_t>(t) * static_cast<size_t>(num_envs_) + static_cast<size_t>(env);
    }
};

} // namespace RL
} // namespace SpecOpt
