#pragma once

#include "math/matrix_interface.hpp"
#include <memory>
#include <string>

namespace SpecOpt {
namespace Math {

/**
 * Parameter - A named trainable matrix with gradient storage
 * Used for the weights and biases of the reward model and the policy
 */
class Parameter {
public:
    Parameter(std::string name, std::unique_ptr<IMatrix> data);
    Parameter(std::string name, size_t rows, size_t cols, float init_value = 0.0f);

    const std::string& name() const { return name_; }

    // Access data
    IMatrix* data() { return data_.get(); }
    const IMatrix* data() const { return data_.get(); }

    // Access gradient (allocated lazily)
    IMatrix* grad();
    const IMatrix* grad() const;

    bool has_grad() const { return grad_ != nullptr; }

    void zero_grad();

    // Accumulate gradient (shapes must match)
    void accumulate_grad(const IMatrix& gradient);

    // Replace the weights, e.g. after loading a checkpoint
    void set_data(std::unique_ptr<IMatrix> data);

private:
    std::string name_;
    std::unique_ptr<IMatrix> data_;
    std::unique_ptr<IMatrix> grad_;

    void ensure_grad();
};

} // namespace Math
} // namespace SpecOpt
