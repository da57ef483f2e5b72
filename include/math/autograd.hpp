#pragma once

#include "math/matrix_interface.hpp"
#include <memory>
#include <vector>

namespace SpecOpt {
namespace Math {

/**
 * Autograd utilities for backpropagation
 * Implements forward/backward passes for the dense layers used by the
 * reward model and the actor-critic policy
 */
class Autograd {
public:
    /**
     * Linear layer forward: y = x @ W + b (b broadcast over rows)
     */
    static std::unique_ptr<IMatrix> linear_forward(
        const IMatrix& x,
        const IMatrix& W,
        const IMatrix& b
    );

    /**
     * Linear layer backward: y = x @ W + b
     * Given: dy (gradient w.r.t. output)
     * Accumulates dW += x^T @ dy and db += sum(dy, axis=0), returns dx
     */
    static std::unique_ptr<IMatrix> linear_backward(
        const IMatrix& x,           // Input
        const IMatrix& W,           // Weight
        const IMatrix& dy,          // Gradient w.r.t. output
        IMatrix& dW,                // Gradient w.r.t. weight (accumulated)
        IMatrix* db = nullptr       // Gradient w.r.t. bias (accumulated, optional)
    );

    /**
     * ReLU backward given the activation output y = max(0, x)
     * dx = dy where y > 0, else 0
     */
    static std::unique_ptr<IMatrix> relu_backward(
        const IMatrix& y,
        const IMatrix& dy
    );

    /**
     * Tanh backward given the activation output y = tanh(x)
     * dx = dy * (1 - y^2)
     */
    static std::unique_ptr<IMatrix> tanh_backward(
        const IMatrix& y,
        const IMatrix& dy
    );

    /**
     * Row-wise log-softmax, numerically stable
     */
    static std::unique_ptr<IMatrix> log_softmax_rows(const IMatrix& logits);
};

} // namespace Math
} // namespace SpecOpt
