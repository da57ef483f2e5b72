#pragma once

#include "math/parameter.hpp"
#include "spec/design_spec.hpp"
#include "spec/spec_encoder.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace SpecOpt {
namespace Model {

// Intermediate activations kept for backpropagation
struct RewardForwardCache {
    std::unique_ptr<Math::IMatrix> input;      // (B, K)
    std::unique_ptr<Math::IMatrix> hidden;     // ReLU(input @ W1 + b1), (B, H)
    std::unique_ptr<Math::IMatrix> output;     // hidden @ W2 + b2, (B, 1)
};

/**
 * Learned scorer over (prompt, spec) pairs
 * r = W2^T ReLU(W1^T x + b1) + b2, x = mean-pooled hashed tokens
 *
 * Scoring is const and touches no member state, so one loaded model can be
 * shared across threads through a RewardModelHandle.
 */
class RewardModel {
public:
    static constexpr int DEFAULT_HIDDEN = 64;

    RewardModel(int input_dim = Spec::SpecEncoder::DEFAULT_BUCKETS, int hidden_dim = DEFAULT_HIDDEN);

    // Fresh He-initialized weights from a fixed seed
    void initialize(uint32_t seed);

    float score(const std::string& prompt, const Spec::DesignSpecification& spec) const;
    float score_observation(const Spec::Observation& obs) const;

    // Batched forward pass; fills cache when given
    std::unique_ptr<Math::IMatrix> forward(const Math::IMatrix& input,
                                           RewardForwardCache* cache = nullptr) const;

    // Accumulates parameter gradients for dL/d(output), shape (B, 1)
    void backward(const RewardForwardCache& cache, const Math::IMatrix& grad_output);

    std::vector<Math::Parameter*> parameters();

    /**
     * Write the checkpoint to a temp file with a CRC32 trailer, then rename
     * over path.
     */
    void save(const std::string& path) const;

    /**
     * Load a checkpoint. Throws Utils::ModelUnavailable when the file is
     * missing, corrupt, of another kind, or built for a different input size.
     */
    static std::unique_ptr<RewardModel> load(const std::string& path,
                                             int expected_input_dim = Spec::SpecEncoder::DEFAULT_BUCKETS);

    int input_dim() const { return input_dim_; }
    int hidden_dim() const { return hidden_dim_; }
    const Spec::SpecEncoder& encoder() const { return encoder_; }

private:
    int input_dim_;
    int hidden_dim_;
    Spec::SpecEncoder encoder_;

    Math::Parameter W1_;    // (K, H)
    Math::Parameter b1_;    // (1, H)
    Math::Parameter W2_;    // (H, 1)
    Math::Parameter b2_;    // (1, 1)
};

using RewardModelHandle = std::shared_ptr<const RewardModel>;

} // namespace Model
} // namespace SpecOpt
