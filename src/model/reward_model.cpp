#include "model/reward_model.hpp"
#include "math/autograd.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/serialization.hpp"
#include <cmath>
#include <fstream>
#include <random>
#include <stdexcept>

namespace SpecOpt {
namespace Model {

RewardModel::RewardModel(int input_dim, int hidden_dim)
    : input_dim_(input_dim),
      hidden_dim_(hidden_dim),
      encoder_(input_dim),
      W1_("reward.W1", static_cast<size_t>(input_dim), static_cast<size_t>(hidden_dim)),
      b1_("reward.b1", 1, static_cast<size_t>(hidden_dim)),
      W2_("reward.W2", static_cast<size_t>(hidden_dim), 1),
      b2_("reward.b2", 1, 1) {
    if (hidden_dim_ <= 0) {
        throw std::invalid_argument("Reward model hidden size must be positive");
    }
}

void RewardModel::initialize(uint32_t seed) {
    std::mt19937 gen(seed);
    float scale_1 = std::sqrt(2.0f / static_cast<float>(input_dim_));
    float scale_2 = std::sqrt(2.0f / static_cast<float>(hidden_dim_));

    W1_.set_data(Math::MatrixFactory::random_normal(input_dim_, hidden_dim_, 0.0f, scale_1, gen));
    b1_.data()->zero();
    W2_.set_data(Math::MatrixFactory::random_normal(hidden_dim_, 1, 0.0f, scale_2, gen));
    b2_.data()->zero();
}

std::unique_ptr<Math::IMatrix> RewardModel::forward(const Math::IMatrix& input,
                                                    RewardForwardCache* cache) const {
    if (input.cols() != static_cast<size_t>(input_dim_)) {
        throw std::invalid_argument("Reward model expects " + std::to_string(input_dim_) +
                                    " features, got " + std::to_string(input.cols()));
    }

    auto z1 = Math::Autograd::linear_forward(input, *W1_.data(), *b1_.data());
    auto hidden = z1->relu();
    auto output = Math::Autograd::linear_forward(*hidden, *W2_.data(), *b2_.data());

    if (cache) {
        cache->input = input.clone();
        cache->hidden = std::move(hidden);
        cache->output = output->clone();
    }
    return output;
}

void RewardModel::backward(const RewardForwardCache& cache, const Math::IMatrix& grad_output) {
    if (!cache.input || !cache.hidden) {
        throw std::runtime_error("No cached activations for backprop. Call forward() with a cache first.");
    }

    auto grad_hidden = Math::Autograd::linear_backward(
        *cache.hidden, *W2_.data(), grad_output, *W2_.grad(), b2_.grad());

    auto grad_z1 = Math::Autograd::relu_backward(*cache.hidden, *grad_hidden);

    Math::Autograd::linear_backward(
        *cache.input, *W1_.data(), *grad_z1, *W1_.grad(), b1_.grad());
}

float RewardModel::score_observation(const Spec::Observation& obs) const {
    auto input = Math::MatrixFactory::create(1, obs.size(), obs);
    auto output = forward(*input);
    return output->at(0, 0);
}

float RewardModel::score(const std::string& prompt, const Spec::DesignSpecification& spec) const {
    return score_observation(encoder_.encode(prompt, spec));
}

std::vector<Math::Parameter*> RewardModel::parameters() {
    return {&W1_, &b1_, &W2_, &b2_};
}

void RewardModel::save(const std::string& path) const {
    Utils::Serialization::write_file_atomic(path, [this](std::ostream& out) {
        Utils::Serialization::write_header(out, Utils::Serialization::KIND_REWARD_MODEL);
        Utils::Serialization::write_u32(out, static_cast<uint32_t>(input_dim_));
        Utils::Serialization::write_u32(out, static_cast<uint32_t>(hidden_dim_));
        Utils::Serialization::write_string(out, "fnv1a64-bag");
        Utils::Serialization::write_matrix(out, *W1_.data());
        Utils::Serialization::write_matrix(out, *b1_.data());
        Utils::Serialization::write_matrix(out, *W2_.data());
        Utils::Serialization::write_matrix(out, *b2_.data());
    });
    LOG_INFO("REWARD_MODEL", "Saved reward model to " + path);
}

std::unique_ptr<RewardModel> RewardModel::load(const std::string& path, int expected_input_dim) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw Utils::ModelUnavailable(path, "checkpoint not found");
    }
    if (!Utils::Serialization::validate_checksum(path)) {
        throw Utils::ModelUnavailable(path, "checksum mismatch (truncated or corrupt file)");
    }

    try {
        Utils::Serialization::read_header(in, Utils::Serialization::KIND_REWARD_MODEL);
        int input_dim = static_cast<int>(Utils::Serialization::read_u32(in));
        int hidden_dim = static_cast<int>(Utils::Serialization::read_u32(in));
        std::string encoding = Utils::Serialization::read_string(in);

        if (input_dim != expected_input_dim) {
            throw Utils::ModelUnavailable(path, "input dimension " + std::to_string(input_dim) +
                                          " does not match encoder size " +
                                          std::to_string(expected_input_dim));
        }
        if (encoding != "fnv1a64-bag") {
            throw Utils::ModelUnavailable(path, "unknown feature encoding '" + encoding + "'");
        }

        auto model = std::make_unique<RewardModel>(input_dim, hidden_dim);
        Utils::Serialization::read_matrix(in, *model->W1_.data());
        Utils::Serialization::read_matrix(in, *model->b1_.data());
        Utils::Serialization::read_matrix(in, *model->W2_.data());
        Utils::Serialization::read_matrix(in, *model->b2_.data());

        LOG_INFO("REWARD_MODEL", "Loaded reward model from " + path + " (K=" +
                 std::to_string(input_dim) + ", H=" + std::to_string(hidden_dim) + ")");
        return model;
    } catch (const Utils::ModelUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw Utils::ModelUnavailable(path, e.what());
    }
}

} // namespace Model
} // namespace SpecOpt
