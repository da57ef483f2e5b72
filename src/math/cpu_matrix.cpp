#include "math/cpu_matrix.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <omp.h>

namespace SpecOpt {
namespace Math {

CPUMatrix::CPUMatrix(size_t rows, size_t cols)
    : rows_(rows), cols_(cols), data_(rows * cols, 0.0f) {}

CPUMatrix::CPUMatrix(size_t rows, size_t cols, const std::vector<float>& data)
    : rows_(rows), cols_(cols), data_(data) {
    if (data_.size() != rows * cols) {
        throw std::invalid_argument("Data size doesn't match matrix dimensions");
    }
}

CPUMatrix::CPUMatrix(size_t rows, size_t cols, float initial_value)
    : rows_(rows), cols_(cols), data_(rows * cols, initial_value) {}

void CPUMatrix::check_bounds(size_t i, size_t j) const {
    if (i >= rows_ || j >= cols_) {
        throw std::out_of_range("Matrix index out of bounds");
    }
}

void CPUMatrix::check_dimensions_match(const IMatrix& other) const {
    if (rows_ != other.rows() || cols_ != other.cols()) {
        throw std::invalid_argument("Matrix dimensions don't match");
    }
}

float& CPUMatrix::at(size_t i, size_t j) {
    check_bounds(i, j);
    return data_[i * cols_ + j];
}

const float& CPUMatrix::at(size_t i, size_t j) const {
    check_bounds(i, j);
    return data_[i * cols_ + j];
}

std::unique_ptr<IMatrix> CPUMatrix::transpose() const {
    auto result = std::make_unique<CPUMatrix>(cols_, rows_);
    float* out = result->data();
    for (size_t i = 0; i < rows_; ++i) {
        for (size_t j = 0; j < cols_; ++j) {
            out[j * rows_ + i] = data_[i * cols_ + j];
        }
    }
    return result;
}

std::unique_ptr<IMatrix> CPUMatrix::matmul(const IMatrix& other) const {
    if (cols_ != other.rows()) {
        throw std::invalid_argument("Matrix dimensions incompatible for multiplication: (" +
                                    std::to_string(rows_) + "x" + std::to_string(cols_) + ") @ (" +
                                    std::to_string(other.rows()) + "x" + std::to_string(other.cols()) + ")");
    }

    const size_t n = other.cols();
    auto result = std::make_unique<CPUMatrix>(rows_, n);
    const float* a = data_.data();
    const float* b = other.data();
    float* c = result->data();

    // i-k-j order keeps the inner loop contiguous; every output row is owned
    // by one thread so results do not depend on the thread count
    #pragma omp parallel for if(rows_ * cols_ * n > 65536)
    for (size_t i = 0; i < rows_; ++i) {
        float* c_row = c + i * n;
        for (size_t k = 0; k < cols_; ++k) {
            const float a_ik = a[i * cols_ + k];
            if (a_ik == 0.0f) {
                continue;
            }
            const float* b_row = b + k * n;
            for (size_t j = 0; j < n; ++j) {
                c_row[j] += a_ik * b_row[j];
            }
        }
    }

    return result;
}

void CPUMatrix::add_inplace(const IMatrix& other) {
    check_dimensions_match(other);
    const float* src = other.data();
    const size_t n = size();

    #pragma omp parallel for simd if(n > 65536)
    for (size_t i = 0; i < n; ++i) {
        data_[i] += src[i];
    }
}

void CPUMatrix::add_row_inplace(const IMatrix& row) {
    if (row.rows() != 1 || row.cols() != cols_) {
        throw std::invalid_argument("Row broadcast requires a (1, " + std::to_string(cols_) + ") matrix");
    }
    const float* src = row.data();
    for (size_t i = 0; i < rows_; ++i) {
        float* dst = data_.data() + i * cols_;
        for (size_t j = 0; j < cols_; ++j) {
            dst[j] += src[j];
        }
    }
}

void CPUMatrix::multiply_inplace(float scalar) {
    const size_t n = size();

    #pragma omp parallel for simd if(n > 65536)
    for (size_t i = 0; i < n; ++i) {
        data_[i] *= scalar;
    }
}

std::unique_ptr<IMatrix> CPUMatrix::clone() const {
    return std::make_unique<CPUMatrix>(rows_, cols_, data_);
}

void CPUMatrix::zero() {
    std::fill(data_.begin(), data_.end(), 0.0f);
}

float CPUMatrix::sum() const {
    // Sequential on purpose: a fixed summation order keeps scores bit-stable
    double total = 0.0;
    for (float v : data_) {
        total += v;
    }
    return static_cast<float>(total);
}

float CPUMatrix::squared_norm() const {
    double total = 0.0;
    for (float v : data_) {
        total += static_cast<double>(v) * v;
    }
    return static_cast<float>(total);
}

std::unique_ptr<IMatrix> CPUMatrix::relu() const {
    auto result = std::make_unique<CPUMatrix>(rows_, cols_);
    float* out = result->data();
    const size_t n = size();
    for (size_t i = 0; i < n; ++i) {
        out[i] = data_[i] > 0.0f ? data_[i] : 0.0f;
    }
    return result;
}

std::unique_ptr<IMatrix> CPUMatrix::tanh() const {
    auto result = std::make_unique<CPUMatrix>(rows_, cols_);
    float* out = result->data();
    const size_t n = size();
    for (size_t i = 0; i < n; ++i) {
        out[i] = std::tanh(data_[i]);
    }
    return result;
}

// MatrixFactory

std::unique_ptr<IMatrix> MatrixFactory::create(size_t rows, size_t cols) {
    return std::make_unique<CPUMatrix>(rows, cols);
}

std::unique_ptr<IMatrix> MatrixFactory::create(size_t rows, size_t cols, const std::vector<float>& data) {
    return std::make_unique<CPUMatrix>(rows, cols, data);
}

std::unique_ptr<IMatrix> MatrixFactory::create(size_t rows, size_t cols, float initial_value) {
    return std::make_unique<CPUMatrix>(rows, cols, initial_value);
}

std::unique_ptr<IMatrix> MatrixFactory::zeros(size_t rows, size_t cols) {
    return std::make_unique<CPUMatrix>(rows, cols);
}

std::unique_ptr<IMatrix> MatrixFactory::random_normal(size_t rows, size_t cols, float mean, float stddev,
                                                      std::mt19937& gen) {
    auto result = std::make_unique<CPUMatrix>(rows, cols);
    std::normal_distribution<float> dis(mean, stddev);

    for (size_t i = 0; i < rows * cols; ++i) {
        result->data()[i] = dis(gen);
    }

    return result;
}

std::unique_ptr<IMatrix> MatrixFactory::random_uniform(size_t rows, size_t cols, float min, float max,
                                                       std::mt19937& gen) {
    auto result = std::make_unique<CPUMatrix>(rows, cols);
    std::uniform_real_distribution<float> dis(min, max);

    for (size_t i = 0; i < rows * cols; ++i) {
        result->data()[i] = dis(gen);
    }

    return result;
}

} // namespace Math
} // namespace SpecOpt
