#include "model/policy.hpp"
#include "math/autograd.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/serialization.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace SpecOpt {
namespace Model {

namespace {

std::unique_ptr<Math::IMatrix> as_row(const Spec::Observation& obs) {
    return Math::MatrixFactory::create(1, obs.size(), obs);
}

} // namespace

ActorCriticPolicy::ActorCriticPolicy(int obs_dim, int action_dim, int hidden_dim)
    : obs_dim_(obs_dim),
      action_dim_(action_dim),
      hidden_dim_(hidden_dim),
      W1_("policy.W1", static_cast<size_t>(obs_dim), static_cast<size_t>(hidden_dim)),
      b1_("policy.b1", 1, static_cast<size_t>(hidden_dim)),
      W2_("policy.W2", static_cast<size_t>(hidden_dim), static_cast<size_t>(hidden_dim)),
      b2_("policy.b2", 1, static_cast<size_t>(hidden_dim)),
      Wpi_("policy.Wpi", static_cast<size_t>(hidden_dim), static_cast<size_t>(action_dim)),
      bpi_("policy.bpi", 1, static_cast<size_t>(action_dim)),
      Wv_("policy.Wv", static_cast<size_t>(hidden_dim), 1),
      bv_("policy.bv", 1, 1) {
    if (obs_dim_ <= 0 || action_dim_ <= 0 || hidden_dim_ <= 0) {
        throw std::invalid_argument("Policy dimensions must be positive");
    }
}

void ActorCriticPolicy::initialize(uint32_t seed) {
    std::mt19937 gen(seed);
    float scale_in = 1.0f / std::sqrt(static_cast<float>(obs_dim_));
    float scale_hidden = 1.0f / std::sqrt(static_cast<float>(hidden_dim_));

    W1_.set_data(Math::MatrixFactory::random_normal(obs_dim_, hidden_dim_, 0.0f, scale_in, gen));
    W2_.set_data(Math::MatrixFactory::random_normal(hidden_dim_, hidden_dim_, 0.0f, scale_hidden, gen));
    // Small policy head keeps the initial distribution close to uniform
    Wpi_.set_data(Math::MatrixFactory::random_normal(hidden_dim_, action_dim_, 0.0f, 0.01f, gen));
    Wv_.set_data(Math::MatrixFactory::random_normal(hidden_dim_, 1, 0.0f, scale_hidden, gen));

    b1_.data()->zero();
    b2_.data()->zero();
    bpi_.data()->zero();
    bv_.data()->zero();
}

PolicyOutput ActorCriticPolicy::forward(const Math::IMatrix& input, PolicyForwardCache* cache) const {
    if (input.cols() != static_cast<size_t>(obs_dim_)) {
        throw std::invalid_argument("Policy expects " + std::to_string(obs_dim_) +
                                    " features, got " + std::to_string(input.cols()));
    }

    auto h1 = Math::Autograd::linear_forward(input, *W1_.data(), *b1_.data())->tanh();
    auto h2 = Math::Autograd::linear_forward(*h1, *W2_.data(), *b2_.data())->tanh();
    auto logits = Math::Autograd::linear_forward(*h2, *Wpi_.data(), *bpi_.data());

    PolicyOutput output;
    output.log_probs = Math::Autograd::log_softmax_rows(*logits);
    output.values = Math::Autograd::linear_forward(*h2, *Wv_.data(), *bv_.data());

    if (cache) {
        cache->input = input.clone();
        cache->h1 = std::move(h1);
        cache->h2 = std::move(h2);
    }
    return output;
}

int ActorCriticPolicy::act_greedy(const Spec::Observation& obs) const {
    auto input = as_row(obs);
    auto output = forward(*input);
    int best = 0;
    float best_lp = output.log_probs->at(0, 0);
    for (int a = 1; a < action_dim_; ++a) {
        float lp = output.log_probs->at(0, static_cast<size_t>(a));
        if (lp > best_lp) {
            best_lp = lp;
            best = a;
        }
    }
    return best;
}

ActionSample ActorCriticPolicy::sample(const Spec::Observation& obs, std::mt19937& gen) const {
    auto input = as_row(obs);
    auto output = forward(*input);

    std::uniform_real_distribution<double> dist(0.0, 1.0);
    double u = dist(gen);
    double cumulative = 0.0;
    int chosen = action_dim_ - 1;
    for (int a = 0; a < action_dim_; ++a) {
        cumulative += std::exp(static_cast<double>(output.log_probs->at(0, static_cast<size_t>(a))));
        if (u < cumulative) {
            chosen = a;
            break;
        }
    }

    return ActionSample{chosen,
                        output.log_probs->at(0, static_cast<size_t>(chosen)),
                        output.values->at(0, 0)};
}

float ActorCriticPolicy::value(const Spec::Observation& obs) const {
    auto input = as_row(obs);
    return forward(*input).values->at(0, 0);
}

void ActorCriticPolicy::backward(const PolicyForwardCache& cache,
                                 const Math::IMatrix& grad_logits,
                                 const Math::IMatrix& grad_values) {
    if (!cache.input || !cache.h1 || !cache.h2) {
        throw std::runtime_error("No cached activations for backprop. Call forward() with a cache first.");
    }

    // Both heads read h2; their input gradients add up
    auto grad_h2 = Math::Autograd::linear_backward(
        *cache.h2, *Wpi_.data(), grad_logits, *Wpi_.grad(), bpi_.grad());
    auto grad_h2_value = Math::Autograd::linear_backward(
        *cache.h2, *Wv_.data(), grad_values, *Wv_.grad(), bv_.grad());
    grad_h2->add_inplace(*grad_h2_value);

    auto grad_z2 = Math::Autograd::tanh_backward(*cache.h2, *grad_h2);
    auto grad_h1 = Math::Autograd::linear_backward(
        *cache.h1, *W2_.data(), *grad_z2, *W2_.grad(), b2_.grad());

    auto grad_z1 = Math::Autograd::tanh_backward(*cache.h1, *grad_h1);
    Math::Autograd::linear_backward(
        *cache.input, *W1_.data(), *grad_z1, *W1_.grad(), b1_.grad());
}

std::vector<Math::Parameter*> ActorCriticPolicy::parameters() {
    return {&W1_, &b1_, &W2_, &b2_, &Wpi_, &bpi_, &Wv_, &bv_};
}

void ActorCriticPolicy::write_weights(std::ostream& out) const {
    Utils::Serialization::write_u32(out, static_cast<uint32_t>(obs_dim_));
    Utils::Serialization::write_u32(out, static_cast<uint32_t>(action_dim_));
    Utils::Serialization::write_u32(out, static_cast<uint32_t>(hidden_dim_));
    for (const Math::Parameter* p : {&W1_, &b1_, &W2_, &b2_, &Wpi_, &bpi_, &Wv_, &bv_}) {
        Utils::Serialization::write_matrix(out, *p->data());
    }
}

void ActorCriticPolicy::read_weights(std::istream& in) {
    int obs_dim = static_cast<int>(Utils::Serialization::read_u32(in));
    int action_dim = static_cast<int>(Utils::Serialization::read_u32(in));
    int hidden_dim = static_cast<int>(Utils::Serialization::read_u32(in));
    if (obs_dim != obs_dim_ || action_dim != action_dim_ || hidden_dim != hidden_dim_) {
        throw std::runtime_error("Policy shape mismatch: stored (" + std::to_string(obs_dim) + ", " +
                                 std::to_string(action_dim) + ", " + std::to_string(hidden_dim) +
                                 "), expected (" + std::to_string(obs_dim_) + ", " +
                                 std::to_string(action_dim_) + ", " + std::to_string(hidden_dim_) + ")");
    }
    for (Math::Parameter* p : parameters()) {
        Utils::Serialization::read_matrix(in, *p->data());
    }
}

void ActorCriticPolicy::save(const std::string& path) const {
    Utils::Serialization::write_file_atomic(path, [this](std::ostream& out) {
        Utils::Serialization::write_header(out, Utils::Serialization::KIND_POLICY);
        write_weights(out);
        Utils::Serialization::write_u32(out, 0);   // no trainer state
    });
    LOG_INFO("POLICY", "Saved policy to " + path);
}

std::unique_ptr<ActorCriticPolicy> ActorCriticPolicy::load(const std::string& path, int obs_dim, int action_dim) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw Utils::ModelUnavailable(path, "checkpoint not found");
    }
    if (!Utils::Serialization::validate_checksum(path)) {
        throw Utils::ModelUnavailable(path, "checksum mismatch (truncated or corrupt file)");
    }

    try {
        Utils::Serialization::read_header(in, Utils::Serialization::KIND_POLICY);

        // Peek at the hidden size, then rewind to let read_weights check everything
        std::streampos weights_start = in.tellg();
        int stored_obs = static_cast<int>(Utils::Serialization::read_u32(in));
        int stored_actions = static_cast<int>(Utils::Serialization::read_u32(in));
        int hidden_dim = static_cast<int>(Utils::Serialization::read_u32(in));
        if (stored_obs != obs_dim || stored_actions != action_dim) {
            throw Utils::ModelUnavailable(path, "policy built for " + std::to_string(stored_obs) +
                                          " features / " + std::to_string(stored_actions) +
                                          " actions, expected " + std::to_string(obs_dim) + " / " +
                                          std::to_string(action_dim));
        }
        in.seekg(weights_start);

        auto policy = std::make_unique<ActorCriticPolicy>(obs_dim, action_dim, hidden_dim);
        policy->read_weights(in);
        LOG_INFO("POLICY", "Loaded policy from " + path);
        return policy;
    } catch (const Utils::ModelUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw Utils::ModelUnavailable(path, e.what());
    }
}

} // namespace Model
} // namespace SpecOpt
