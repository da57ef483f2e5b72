#pragma once

#include "math/parameter.hpp"
#include "spec/spec_encoder.hpp"
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace SpecOpt {
namespace Model {

// Intermediate activations kept for backpropagation
struct PolicyForwardCache {
    std::unique_ptr<Math::IMatrix> input;      // (B, K)
    std::unique_ptr<Math::IMatrix> h1;         // tanh(input @ W1 + b1), (B, H)
    std::unique_ptr<Math::IMatrix> h2;         // tanh(h1 @ W2 + b2), (B, H)
};

struct PolicyOutput {
    std::unique_ptr<Math::IMatrix> log_probs;  // (B, N)
    std::unique_ptr<Math::IMatrix> values;     // (B, 1)
};

struct ActionSample {
    int action;
    float log_prob;
    float value;
};

/**
 * Actor-critic MLP over encoded observations
 *
 *   h1 = tanh(x W1 + b1), h2 = tanh(h1 W2 + b2)
 *   logits = h2 Wpi + bpi, value = h2 Wv + bv
 *
 * Inference methods are const and keep activations in caller-owned caches,
 * so rollout workers can share one policy read-only.
 */
class ActorCriticPolicy {
public:
    static constexpr int DEFAULT_HIDDEN = 64;

    ActorCriticPolicy(int obs_dim, int action_dim, int hidden_dim = DEFAULT_HIDDEN);

    void initialize(uint32_t seed);

    PolicyOutput forward(const Math::IMatrix& input, PolicyForwardCache* cache = nullptr) const;

    // Argmax action; ties resolve to the lowest index
    int act_greedy(const Spec::Observation& obs) const;

    ActionSample sample(const Spec::Observation& obs, std::mt19937& gen) const;

    float value(const Spec::Observation& obs) const;

    /**
     * Accumulate parameter gradients given dL/dlogits (B, N) and
     * dL/dvalues (B, 1)
     */
    void backward(const PolicyForwardCache& cache,
                  const Math::IMatrix& grad_logits,
                  const Math::IMatrix& grad_values);

    std::vector<Math::Parameter*> parameters();

    // Dimensions followed by the weight matrices
    void write_weights(std::ostream& out) const;

    // Throws std::runtime_error when the stored shape differs from this policy
    void read_weights(std::istream& in);

    /**
     * Standalone policy checkpoint (no trainer state).
     * load() throws Utils::ModelUnavailable when the file is missing, corrupt
     * or shaped for a different encoder / action space. Trailing trainer
     * state in a training checkpoint is ignored.
     */
    void save(const std::string& path) const;
    static std::unique_ptr<ActorCriticPolicy> load(const std::string& path, int obs_dim, int action_dim);

    int obs_dim() const { return obs_dim_; }
    int action_dim() const { return action_dim_; }
    int hidden_dim() const { return hidden_dim_; }

private:
    int obs_dim_;
    int action_dim_;
    int hidden_dim_;

    Math::Parameter W1_;
    Math::Parameter b1_;
    Math::Parameter W2_;
    Math::Parameter b2_;
    Math::Parameter Wpi_;
    Math::Parameter bpi_;
    Math::Parameter Wv_;
    Math::Parameter bv_;
};

} // namespace Model
} // namespace SpecOpt
