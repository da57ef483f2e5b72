#include "math/parameter.hpp"
#include <stdexcept>

namespace SpecOpt {
namespace Math {

Parameter::Parameter(std::string name, std::unique_ptr<IMatrix> data)
    : name_(std::move(name)), data_(std::move(data)), grad_(nullptr) {
}

Parameter::Parameter(std::string name, size_t rows, size_t cols, float init_value)
    : name_(std::move(name)), data_(MatrixFactory::create(rows, cols, init_value)), grad_(nullptr) {
}

IMatrix* Parameter::grad() {
    ensure_grad();
    return grad_.get();
}

const IMatrix* Parameter::grad() const {
    return grad_.get();
}

void Parameter::zero_grad() {
    if (grad_) {
        grad_->zero();
    }
}

void Parameter::accumulate_grad(const IMatrix& gradient) {
    ensure_grad();
    if (gradient.rows() != grad_->rows() || gradient.cols() != grad_->cols()) {
        throw std::invalid_argument("Gradient shape mismatch for parameter " + name_);
    }
    grad_->add_inplace(gradient);
}

void Parameter::set_data(std::unique_ptr<IMatrix> data) {
    if (data_ && (data->rows() != data_->rows() || data->cols() != data_->cols())) {
        throw std::invalid_argument("Shape mismatch when replacing parameter " + name_);
    }
    data_ = std::move(data);
}

void Parameter::ensure_grad() {
    if (!grad_ && data_) {
        grad_ = MatrixFactory::create(data_->rows(), data_->cols(), 0.0f);
    }
}

} // namespace Math
} // namespace SpecOpt
