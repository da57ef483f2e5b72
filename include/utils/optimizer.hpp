#pragma once

#include "math/parameter.hpp"
#include <istream>
#include <ostream>
#include <vector>
#include <memory>
#include <string>

namespace SpecOpt {
namespace Utils {

/**
 * Abstract optimizer interface for the reward model and policy trainers
 */
class Optimizer {
public:
    virtual ~Optimizer() = default;

    /**
     * Update parameters using their accumulated gradients
     */
    virtual void step(std::vector<Math::Parameter*>& params) = 0;

    /**
     * Zero gradients of all parameters
     */
    virtual void zero_grad(std::vector<Math::Parameter*>& params);

    virtual std::string name() const = 0;
    virtual float get_learning_rate() const = 0;

    /**
     * Persist / restore moment buffers so an interrupted run resumes exactly
     */
    virtual void save_state(std::ostream& out) const = 0;
    virtual void load_state(std::istream& in) = 0;
};

/**
 * Scale gradients so their global L2 norm is at most max_norm
 * @return the norm before clipping
 */
float clip_grad_norm(std::vector<Math::Parameter*>& params, float max_norm);

/**
 * Adam optimizer (Kingma & Ba, 2014)
 *
 * - m_t = beta1 * m_{t-1} + (1 - beta1) * grad
 * - v_t = beta2 * v_{t-1} + (1 - beta2) * grad^2
 * - theta_t = theta_{t-1} - lr * m_hat / (sqrt(v_hat) + epsilon)
 */
class AdamOptimizer : public Optimizer {
public:
    explicit AdamOptimizer(
        float learning_rate = 0.001f,
        float beta1 = 0.9f,
        float beta2 = 0.999f,
        float epsilon = 1e-8f);

    void step(std::vector<Math::Parameter*>& params) override;
    std::string name() const override { return "Adam"; }
    float get_learning_rate() const override { return learning_rate_; }

    void save_state(std::ostream& out) const override;
    void load_state(std::istream& in) override;

protected:
    float learning_rate_;
    float beta1_;
    float beta2_;
    float epsilon_;
    float weight_decay_ = 0.0f;
    int step_count_;

    std::vector<std::unique_ptr<Math::IMatrix>> m_;
    std::vector<std::unique_ptr<Math::IMatrix>> v_;
};

/**
 * AdamW (Loshchilov & Hutter, 2017): decoupled weight decay
 * theta_t = theta_{t-1} - lr * (m_hat / (sqrt(v_hat) + epsilon) + weight_decay * theta_{t-1})
 */
class AdamWOptimizer : public AdamOptimizer {
public:
    explicit AdamWOptimizer(
        float learning_rate = 0.001f,
        float beta1 = 0.9f,
        float beta2 = 0.999f,
        float epsilon = 1e-8f,
        float weight_decay = 0.01f);

    std::string name() const override { return "AdamW"; }
};

/**
 * Factory for the trainers' optimizers
 */
class OptimizerFactory {
public:
    enum class Type {
        Adam,
        AdamW
    };

    static std::unique_ptr<Optimizer> create(
        Type type,
        float learning_rate,
        float weight_decay = 0.01f);
};

} // namespace Utils
} // namespace SpecOpt
