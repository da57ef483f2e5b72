#include "math/autograd.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace SpecOpt {
namespace Math {

std::unique_ptr<IMatrix> Autograd::linear_forward(
    const IMatrix& x,
    const IMatrix& W,
    const IMatrix& b) {

    auto y = x.matmul(W);
    y->add_row_inplace(b);
    return y;
}

std::unique_ptr<IMatrix> Autograd::linear_backward(
    const IMatrix& x,
    const IMatrix& W,
    const IMatrix& dy,
    IMatrix& dW,
    IMatrix* db) {

    if (dW.rows() != W.rows() || dW.cols() != W.cols()) {
        throw std::invalid_argument("linear_backward: dW shape does not match W");
    }

    // y = x @ W
    // dy/dx = dy @ W^T
    // dy/dW = x^T @ dy
    // dy/db = sum(dy, axis=0)

    auto W_T = W.transpose();
    auto dx = dy.matmul(*W_T);

    auto x_T = x.transpose();
    auto dW_result = x_T->matmul(dy);
    dW.add_inplace(*dW_result);

    if (db) {
        size_t batch_size = dy.rows();
        size_t out_dim = dy.cols();
        if (db->size() != out_dim) {
            throw std::invalid_argument("linear_backward: db has " + std::to_string(db->size()) +
                                        " entries, expected " + std::to_string(out_dim));
        }
        float* db_data = db->data();

        #pragma omp parallel for schedule(static) if(out_dim > 256)
        for (size_t j = 0; j < out_dim; ++j) {
            float sum = 0.0f;
            for (size_t i = 0; i < batch_size; ++i) {
                sum += dy.at(i, j);
            }
            db_data[j] += sum;
        }
    }

    return dx;
}

std::unique_ptr<IMatrix> Autograd::relu_backward(
    const IMatrix& y,
    const IMatrix& dy) {

    auto dx = dy.clone();
    const float* y_data = y.data();
    float* dx_data = dx->data();
    size_t size = dx->size();

    for (size_t i = 0; i < size; ++i) {
        if (y_data[i] <= 0.0f) {
            dx_data[i] = 0.0f;
        }
    }
    return dx;
}

std::unique_ptr<IMatrix> Autograd::tanh_backward(
    const IMatrix& y,
    const IMatrix& dy) {

    auto dx = dy.clone();
    const float* y_data = y.data();
    float* dx_data = dx->data();
    size_t size = dx->size();

    for (size_t i = 0; i < size; ++i) {
        dx_data[i] *= 1.0f - y_data[i] * y_data[i];
    }
    return dx;
}

std::unique_ptr<IMatrix> Autograd::log_softmax_rows(const IMatrix& logits) {
    auto out = logits.clone();
    size_t rows = out->rows();
    size_t cols = out->cols();

    for (size_t i = 0; i < rows; ++i) {
        float* row = out->data() + i * cols;
        float max_val = row[0];
        for (size_t j = 1; j < cols; ++j) {
            max_val = std::max(max_val, row[j]);
        }
        double sum = 0.0;
        for (size_t j = 0; j < cols; ++j) {
            sum += std::exp(static_cast<double>(row[j] - max_val));
        }
        float log_z = max_val + static_cast<float>(std::log(sum));
        for (size_t j = 0; j < cols; ++j) {
            row[j] -= log_z;
        }
    }
    return out;
}

} // namespace Math
} // namespace SpecOpt
