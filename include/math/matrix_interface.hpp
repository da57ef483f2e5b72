#pragma once

#include <vector>
#include <memory>
#include <random>
#include <cstddef>

namespace SpecOpt {
namespace Math {

// Abstract dense matrix (row-major). Models and optimizers only talk to this
// interface so the CPU backend can be swapped without touching them.
class IMatrix {
public:
    virtual ~IMatrix() = default;

    // Dimensions
    virtual size_t rows() const = 0;
    virtual size_t cols() const = 0;
    virtual size_t size() const = 0;

    // Element access
    virtual float& at(size_t i, size_t j) = 0;
    virtual const float& at(size_t i, size_t j) const = 0;
    virtual float* data() = 0;
    virtual const float* data() const = 0;

    // Matrix operations
    virtual std::unique_ptr<IMatrix> transpose() const = 0;
    virtual std::unique_ptr<IMatrix> matmul(const IMatrix& other) const = 0;

    // In-place operations
    virtual void add_inplace(const IMatrix& other) = 0;
    virtual void add_row_inplace(const IMatrix& row) = 0;   // broadcast a (1, cols) row
    virtual void multiply_inplace(float scalar) = 0;

    // Utility operations
    virtual std::unique_ptr<IMatrix> clone() const = 0;
    virtual void zero() = 0;
    virtual float sum() const = 0;
    virtual float squared_norm() const = 0;

    // Activation functions
    virtual std::unique_ptr<IMatrix> relu() const = 0;
    virtual std::unique_ptr<IMatrix> tanh() const = 0;
};

// Factory for creating matrix instances (CPU backend)
class MatrixFactory {
public:
    static std::unique_ptr<IMatrix> create(size_t rows, size_t cols);
    static std::unique_ptr<IMatrix> create(size_t rows, size_t cols, const std::vector<float>& data);
    static std::unique_ptr<IMatrix> create(size_t rows, size_t cols, float initial_value);
    static std::unique_ptr<IMatrix> zeros(size_t rows, size_t cols);

    // Seeded initializers; weights must be reproducible for resumable training
    static std::unique_ptr<IMatrix> random_normal(size_t rows, size_t cols, float mean, float stddev,
                                                  std::mt19937& gen);
    static std::unique_ptr<IMatrix> random_uniform(size_t rows, size_t cols, float min, float max,
                                                   std::mt19937& gen);
};

} // namespace Math
} // namespace SpecOpt
