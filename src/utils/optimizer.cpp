#include "utils/optimizer.hpp"
#include "utils/serialization.hpp"
#include <cmath>
#include <stdexcept>

namespace SpecOpt {
namespace Utils {

namespace {

void write_buffers(std::ostream& out, const std::vector<std::unique_ptr<Math::IMatrix>>& buffers) {
    Serialization::write_u32(out, static_cast<uint32_t>(buffers.size()));
    for (const auto& buf : buffers) {
        Serialization::write_matrix(out, *buf);
    }
}

std::vector<std::unique_ptr<Math::IMatrix>> read_buffers(std::istream& in) {
    uint32_t count = Serialization::read_u32(in);
    std::vector<std::unique_ptr<Math::IMatrix>> buffers;
    buffers.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        auto dims = Serialization::read_matrix_dims(in);
        auto buf = Math::MatrixFactory::create(dims.first, dims.second);
        in.read(reinterpret_cast<char*>(buf->data()),
                static_cast<std::streamsize>(buf->size() * sizeof(float)));
        if (!in) {
            throw std::runtime_error("Unexpected end of optimizer state");
        }
        buffers.push_back(std::move(buf));
    }
    return buffers;
}

std::vector<std::unique_ptr<Math::IMatrix>> zeros_like(const std::vector<Math::Parameter*>& params) {
    std::vector<std::unique_ptr<Math::IMatrix>> buffers;
    buffers.reserve(params.size());
    for (auto* param : params) {
        buffers.push_back(Math::MatrixFactory::zeros(param->data()->rows(), param->data()->cols()));
    }
    return buffers;
}

void check_buffers(const std::vector<std::unique_ptr<Math::IMatrix>>& buffers,
                   const std::vector<Math::Parameter*>& params) {
    if (buffers.size() != params.size()) {
        throw std::runtime_error("Optimizer state holds " + std::to_string(buffers.size()) +
                                 " buffers for " + std::to_string(params.size()) + " parameters");
    }
    for (size_t i = 0; i < params.size(); ++i) {
        if (buffers[i]->rows() != params[i]->data()->rows() ||
            buffers[i]->cols() != params[i]->data()->cols()) {
            throw std::runtime_error("Optimizer state shape mismatch for " + params[i]->name());
        }
    }
}

} // namespace

void Optimizer::zero_grad(std::vector<Math::Parameter*>& params) {
    for (auto* param : params) {
        if (param) {
            param->zero_grad();
        }
    }
}

float clip_grad_norm(std::vector<Math::Parameter*>& params, float max_norm) {
    double total = 0.0;
    for (auto* param : params) {
        if (param && param->has_grad()) {
            total += param->grad()->squared_norm();
        }
    }
    float norm = static_cast<float>(std::sqrt(total));

    if (max_norm > 0.0f && norm > max_norm) {
        float scale = max_norm / (norm + 1e-6f);
        for (auto* param : params) {
            if (param && param->has_grad()) {
                param->grad()->multiply_inplace(scale);
            }
        }
    }
    return norm;
}

// Adam

AdamOptimizer::AdamOptimizer(float learning_rate, float beta1, float beta2, float epsilon)
    : learning_rate_(learning_rate),
      beta1_(beta1),
      beta2_(beta2),
      epsilon_(epsilon),
      step_count_(0) {
}

void AdamOptimizer::step(std::vector<Math::Parameter*>& params) {
    if (m_.empty()) {
        m_ = zeros_like(params);
        v_ = zeros_like(params);
    }
    check_buffers(m_, params);

    step_count_++;

    float bias_correction1 = 1.0f - std::pow(beta1_, static_cast<float>(step_count_));
    float bias_correction2 = 1.0f - std::pow(beta2_, static_cast<float>(step_count_));

    for (size_t i = 0; i < params.size(); ++i) {
        auto* param = params[i];
        if (!param || !param->has_grad()) {
            continue;
        }

        const float* grad_data = param->grad()->data();
        float* param_data = param->data()->data();
        float* m_data = m_[i]->data();
        float* v_data = v_[i]->data();
        size_t size = param->data()->size();

        #pragma omp parallel for if(size > 65536)
        for (size_t j = 0; j < size; ++j) {
            m_data[j] = beta1_ * m_data[j] + (1.0f - beta1_) * grad_data[j];
            v_data[j] = beta2_ * v_data[j] + (1.0f - beta2_) * grad_data[j] * grad_data[j];

            float m_hat = m_data[j] / bias_correction1;
            float v_hat = v_data[j] / bias_correction2;

            float update = m_hat / (std::sqrt(v_hat) + epsilon_);
            if (weight_decay_ > 0.0f) {
                update += weight_decay_ * param_data[j];
            }
            param_data[j] -= learning_rate_ * update;
        }
    }
}

void AdamOptimizer::save_state(std::ostream& out) const {
    Serialization::write_f32(out, learning_rate_);
    Serialization::write_i32(out, step_count_);
    write_buffers(out, m_);
    write_buffers(out, v_);
}

void AdamOptimizer::load_state(std::istream& in) {
    learning_rate_ = Serialization::read_f32(in);
    step_count_ = Serialization::read_i32(in);
    m_ = read_buffers(in);
    v_ = read_buffers(in);
    if (m_.size() != v_.size()) {
        throw std::runtime_error("Adam state has mismatched moment buffers");
    }
}

// AdamW

AdamWOptimizer::AdamWOptimizer(float learning_rate, float beta1, float beta2, float epsilon,
                               float weight_decay)
    : AdamOptimizer(learning_rate, beta1, beta2, epsilon) {
    weight_decay_ = weight_decay;
}

// Factory

std::unique_ptr<Optimizer> OptimizerFactory::create(Type type, float learning_rate, float weight_decay) {
    switch (type) {
        case Type::Adam:
            return std::make_unique<AdamOptimizer>(learning_rate);
        case Type::AdamW:
            return std::make_unique<AdamWOptimizer>(learning_rate, 0.9f, 0.999f, 1e-8f, weight_decay);
    }
    throw std::invalid_argument("Unknown optimizer type");
}

} // namespace Utils
} // namespace SpecOpt
