#pragma once

#include "matrix_interface.hpp"
#include <vector>
#include <stdexcept>

namespace SpecOpt {
namespace Math {

// Plain CPU implementation, OpenMP over rows
class CPUMatrix : public IMatrix {
public:
    CPUMatrix(size_t rows, size_t cols);
    CPUMatrix(size_t rows, size_t cols, const std::vector<float>& data);
    CPUMatrix(size_t rows, size_t cols, float initial_value);

    ~CPUMatrix() override = default;

    size_t rows() const override { return rows_; }
    size_t cols() const override { return cols_; }
    size_t size() const override { return rows_ * cols_; }

    float& at(size_t i, size_t j) override;
    const float& at(size_t i, size_t j) const override;
    float* data() override { return data_.data(); }
    const float* data() const override { return data_.data(); }

    std::unique_ptr<IMatrix> transpose() const override;
    std::unique_ptr<IMatrix> matmul(const IMatrix& other) const override;

    void add_inplace(const IMatrix& other) override;
    void add_row_inplace(const IMatrix& row) override;
    void multiply_inplace(float scalar) override;

    std::unique_ptr<IMatrix> clone() const override;
    void zero() override;
    float sum() const override;
    float squared_norm() const override;

    std::unique_ptr<IMatrix> relu() const override;
    std::unique_ptr<IMatrix> tanh() const override;

protected:
    size_t rows_;
    size_t cols_;
    std::vector<float> data_;

    void check_bounds(size_t i, size_t j) const;
    void check_dimensions_match(const IMatrix& other) const;
};

} // namespace Math
} // namespace SpecOpt
