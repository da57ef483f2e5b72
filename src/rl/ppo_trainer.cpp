#include "rl/ppo_trainer.hpp"
#include "utils/errors.hpp"
#include "utils/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <optional>
#include <random>
#include <sstream>
#include <thread>

namespace SpecOpt {
namespace RL {

namespace {

std::string rng_state(const std::mt19937& gen) {
    std::ostringstream oss;
    oss << gen;
    return oss.str();
}

void restore_rng(std::mt19937& gen, const std::string& state) {
    std::istringstream iss(state);
    iss >> gen;
    if (!iss) {
        throw Utils::InvalidState("Corrupt RNG state in checkpoint");
    }
}

// One environment and everything its worker owns
struct EnvSlot {
    std::unique_ptr<Env::SpecEnvironment> env;
    std::mt19937 rng;
    uint32_t cursor = 0;
    int episodes = 0;
    double return_sum = 0.0;
    double running_return = 0.0;
};

struct ParsedBaseSpec {
    std::string prompt;
    std::optional<Spec::DesignSpecification> spec;
};

// Start the slot's next episode from the next valid base spec in its rotation
Spec::Observation reset_next(EnvSlot& slot, const std::vector<ParsedBaseSpec>& bases) {
    const uint32_t n = static_cast<uint32_t>(bases.size());
    for (uint32_t tries = 0; tries < n; ++tries) {
        const ParsedBaseSpec& base = bases[slot.cursor % n];
        slot.cursor = (slot.cursor + 1) % n;
        if (base.spec) {
            slot.running_return = 0.0;
            return slot.env->reset(*base.spec, base.prompt);
        }
    }
    throw Utils::InvalidSpec("base_specs", "no valid base spec to reset from");
}

} // namespace

nlohmann::json PPOHyperparameters::to_json() const {
    return nlohmann::json{
        {"rollout_length", rollout_length},
        {"n_epochs", n_epochs},
        {"minibatch_size", minibatch_size},
        {"gamma", gamma},
        {"gae_lambda", gae_lambda},
        {"clip_epsilon", clip_epsilon},
        {"value_coef", value_coef},
        {"entropy_coef", entropy_coef},
        {"max_grad_norm", max_grad_norm},
        {"learning_rate", learning_rate},
        {"normalize_advantages", normalize_advantages},
        {"hidden_dim", hidden_dim},
        {"seed", seed}
    };
}

PPOTrainer::PPOTrainer(Model::RewardModelHandle reward_model,
                       TrainerOptions options,
                       std::shared_ptr<JobSubmitter> submitter)
    : reward_model_(std::move(reward_model)),
      options_(std::move(options)),
      submitter_(std::move(submitter)),
      logger_("PPO") {
}

std::string PPOTrainer::submit_job(const std::vector<Spec::BaseSpec>& base_specs,
                                   uint64_t steps,
                                   int env_count,
                                   const PPOHyperparameters& hyperparameters) {
    nlohmann::json request;
    request["kind"] = "ppo_train";
    request["steps"] = steps;
    request["env_count"] = env_count;
    request["hyperparameters"] = hyperparameters.to_json();
    request["reward_model_path"] = options_.reward_model_path;
    request["output_dir"] = options_.output_dir;
    request["base_specs"] = nlohmann::json::array();
    for (const auto& base : base_specs) {
        request["base_specs"].push_back(base.to_json());
    }

    if (!submitter_) {
        submitter_ = std::make_shared<SpoolJobSubmitter>(options_.job_spool_dir);
    }
    std::string handle = submitter_->submit(request);
    logger_.info("Routed " + std::to_string(steps) + " steps to the job scheduler as " + handle);
    return handle;
}

TrainOutcome PPOTrainer::train(const std::vector<Spec::BaseSpec>& base_specs,
                               uint64_t steps,
                               int env_count,
                               const PPOHyperparameters& hp,
                               const CancellationToken* cancel) {
    if (!reward_model_) {
        throw Utils::ModelUnavailable(options_.reward_model_path, "no reward model loaded; training needs one");
    }
    if (env_count <= 0 || steps == 0) {
        throw std::invalid_argument("Training needs env_count > 0 and steps > 0");
    }
    if (base_specs.empty()) {
        throw Utils::InvalidSpec("base_specs", "no base specs given");
    }
    if (hp.rollout_length <= 0 || hp.n_epochs <= 0 || hp.minibatch_size <= 0) {
        throw std::invalid_argument("rollout_length, n_epochs and minibatch_size must be positive");
    }

    TrainOutcome outcome;
    if (steps >= options_.local_step_threshold) {
        outcome.job_handle = submit_job(base_specs, steps, env_count, hp);
        return outcome;
    }

    // Parse once; malformed entries are skipped by every env
    std::vector<ParsedBaseSpec> bases;
    size_t valid = 0;
    for (const auto& base : base_specs) {
        ParsedBaseSpec parsed;
        parsed.prompt = base.prompt;
        try {
            parsed.spec = base.parse();
            ++valid;
        } catch (const Utils::InvalidSpec& e) {
            logger_.warning(std::string("Skipping base spec: ") + e.what());
        }
        bases.push_back(std::move(parsed));
    }
    if (valid == 0) {
        throw Utils::InvalidSpec("base_specs", "all " + std::to_string(base_specs.size()) +
                                 " base specs are invalid");
    }

    // Environments, policy, optimizer
    std::vector<EnvSlot> slots(static_cast<size_t>(env_count));
    for (int e = 0; e < env_count; ++e) {
        EnvSlot& slot = slots[static_cast<size_t>(e)];
        slot.env = std::make_unique<Env::SpecEnvironment>(reward_model_, options_.actions, options_.environment);
        slot.rng.seed(hp.seed * 7919u + static_cast<uint32_t>(e) + 1u);
        slot.cursor = static_cast<uint32_t>(static_cast<size_t>(e) % bases.size());
    }

    const int obs_dim = slots[0].env->observation_size();
    const int action_dim = slots[0].env->action_space().size();
    policy_ = std::make_unique<Model::ActorCriticPolicy>(obs_dim, action_dim, hp.hidden_dim);
    policy_->initialize(hp.seed);

    auto optimizer = Utils::OptimizerFactory::create(Utils::OptimizerFactory::Type::Adam, hp.learning_rate);
    auto params = policy_->parameters();
    std::mt19937 trainer_rng(hp.seed);

    CheckpointStore store(options_.output_dir);
    std::string last_checkpoint;
    int updates_done = 0;
    uint64_t steps_done = 0;

    if (options_.resume) {
        auto latest = store.latest();
        if (latest) {
            TrainerState state = store.load(latest->path, *policy_, *optimizer);
            if (state.env_rngs.size() != slots.size()) {
                throw Utils::InvalidState("Checkpoint " + latest->path + " was written with " +
                                          std::to_string(state.env_rngs.size()) + " environments, not " +
                                          std::to_string(env_count));
            }
            restore_rng(trainer_rng, state.trainer_rng);
            for (size_t e = 0; e < slots.size(); ++e) {
                restore_rng(slots[e].rng, state.env_rngs[e]);
                slots[e].cursor = state.cursors[e] % static_cast<uint32_t>(bases.size());
            }
            updates_done = state.updates_completed;
            steps_done = state.steps_completed;
            last_checkpoint = latest->path;
            logger_.info("Resuming from " + latest->path + " at update " + std::to_string(updates_done));
        } else {
            logger_.info("No checkpoint in " + options_.output_dir + "; starting fresh");
        }
    }

    auto snapshot = [&]() {
        TrainerState state;
        state.updates_completed = updates_done;
        state.steps_completed = steps_done;
        state.trainer_rng = rng_state(trainer_rng);
        for (const auto& slot : slots) {
            state.env_rngs.push_back(rng_state(slot.rng));
            state.cursors.push_back(slot.cursor);
        }
        return state;
    };

    const uint64_t steps_per_update = static_cast<uint64_t>(env_count) * static_cast<uint64_t>(hp.rollout_length);
    const int total_updates = static_cast<int>((steps + steps_per_update - 1) / steps_per_update);

    size_t threads = options_.num_threads > 0
                         ? static_cast<size_t>(options_.num_threads)
                         : std::max<size_t>(1, std::min<size_t>(static_cast<size_t>(env_count),
                                                                std::thread::hardware_concurrency()));
    Utils::ThreadPool pool(threads);
    RolloutBuffer buffer(hp.rollout_length, env_count);

    logger_.info("Training: " + std::to_string(total_updates) + " updates x " +
                 std::to_string(steps_per_update) + " steps, " + std::to_string(env_count) +
                 " envs, " + std::to_string(valid) + "/" + std::to_string(bases.size()) +
                 " valid base specs, " + std::to_string(action_dim) + " actions, " + optimizer->name() + " lr " +
                 std::to_string(optimizer->get_learning_rate()));

    const Model::ActorCriticPolicy& rollout_policy = *policy_;
    const size_t k = static_cast<size_t>(obs_dim);
    const size_t n_actions = static_cast<size_t>(action_dim);

    while (updates_done < total_updates) {
        if (cancel && cancel->is_cancelled()) {
            logger_.warning("Cancellation requested after " + std::to_string(updates_done) + " updates");
            throw Utils::TrainingInterrupted(last_checkpoint, updates_done);
        }

        auto start_time = std::chrono::steady_clock::now();

        // Rollout: one worker per env, fresh episode at every rollout start
        for (auto& slot : slots) {
            slot.episodes = 0;
            slot.return_sum = 0.0;
        }
        pool.parallel_for(0, slots.size(), [&](size_t e) {
            EnvSlot& slot = slots[e];
            Spec::Observation obs = reset_next(slot, bases);

            for (int t = 0; t < hp.rollout_length; ++t) {
                Model::ActionSample sample = rollout_policy.sample(obs, slot.rng);
                Env::StepResult result = slot.env->step(sample.action);

                Transition tr;
                tr.observation = std::move(obs);
                tr.action = sample.action;
                tr.log_prob = sample.log_prob;
                tr.value = sample.value;
                tr.reward = result.reward;
                slot.running_return += result.reward;

                if (result.terminated || result.truncated) {
                    tr.episode_end = true;
                    tr.bootstrap_value = result.terminated ? 0.0f : rollout_policy.value(result.observation);
                    slot.episodes++;
                    slot.return_sum += slot.running_return;
                    obs = reset_next(slot, bases);
                } else {
                    obs = std::move(result.observation);
                }
                buffer.set(t, static_cast<int>(e), std::move(tr));
            }
            buffer.set_last_value(static_cast<int>(e), rollout_policy.value(obs));
        });

        buffer.compute_advantages(hp.gamma, hp.gae_lambda, hp.normalize_advantages);

        UpdateStats stats;
        stats.mean_reward = buffer.mean_reward();
        double episode_return_sum = 0.0;
        for (const auto& slot : slots) {
            stats.episodes += slot.episodes;
            episode_return_sum += slot.return_sum;
        }
        stats.mean_episode_return = stats.episodes > 0
                                        ? static_cast<float>(episode_return_sum / stats.episodes)
                                        : 0.0f;

        // Update: shuffled minibatch epochs over the rollout
        std::vector<size_t> order(buffer.size());
        std::iota(order.begin(), order.end(), 0);
        double policy_loss_sum = 0.0, value_loss_sum = 0.0, entropy_sum = 0.0;
        double kl_sum = 0.0, clip_sum = 0.0, grad_norm_sum = 0.0;
        size_t sample_count = 0;
        int minibatches = 0;

        for (int epoch = 0; epoch < hp.n_epochs; ++epoch) {
            std::shuffle(order.begin(), order.end(), trainer_rng);

            for (size_t start = 0; start < order.size(); start += static_cast<size_t>(hp.minibatch_size)) {
                const size_t end = std::min(order.size(), start + static_cast<size_t>(hp.minibatch_size));
                const size_t batch = end - start;
                const float inv_batch = 1.0f / static_cast<float>(batch);

                auto input = Math::MatrixFactory::zeros(batch, k);
                for (size_t b = 0; b < batch; ++b) {
                    const auto& obs = buffer.transition(order[start + b]).observation;
                    std::copy(obs.begin(), obs.end(), input->data() + b * k);
                }

                Model::PolicyForwardCache cache;
                Model::PolicyOutput out = policy_->forward(*input, &cache);

                auto grad_logits = Math::MatrixFactory::zeros(batch, n_actions);
                auto grad_values = Math::MatrixFactory::zeros(batch, 1);

                for (size_t b = 0; b < batch; ++b) {
                    const size_t idx = order[start + b];
                    const Transition& tr = buffer.transition(idx);
                    const float advantage = buffer.advantage(idx);
                    const float ret = buffer.return_at(idx);
                    const size_t a = static_cast<size_t>(tr.action);

                    const float* lp = out.log_probs->data() + b * n_actions;
                    const float lp_new = lp[a];
                    const float ratio = std::exp(lp_new - tr.log_prob);
                    const float clipped = std::min(std::max(ratio, 1.0f - hp.clip_epsilon), 1.0f + hp.clip_epsilon);
                    const float surr1 = ratio * advantage;
                    const float surr2 = clipped * advantage;

                    policy_loss_sum += -std::min(surr1, surr2);
                    // Gradient flows only through the unclipped branch
                    const float grad_lp = surr1 <= surr2 ? -ratio * advantage : 0.0f;

                    float entropy = 0.0f;
                    for (size_t j = 0; j < n_actions; ++j) {
                        entropy -= std::exp(lp[j]) * lp[j];
                    }
                    entropy_sum += entropy;

                    float* g = grad_logits->data() + b * n_actions;
                    for (size_t j = 0; j < n_actions; ++j) {
                        const float p = std::exp(lp[j]);
                        const float onehot = j == a ? 1.0f : 0.0f;
                        g[j] = (grad_lp * (onehot - p) + hp.entropy_coef * p * (lp[j] + entropy)) * inv_batch;
                    }

                    const float v = out.values->at(b, 0);
                    value_loss_sum += 0.5f * (v - ret) * (v - ret);
                    grad_values->at(b, 0) = hp.value_coef * (v - ret) * inv_batch;

                    kl_sum += tr.log_prob - lp_new;
                    if (std::fabs(ratio - 1.0f) > hp.clip_epsilon) {
                        clip_sum += 1.0;
                    }
                }

                optimizer->zero_grad(params);
                policy_->backward(cache, *grad_logits, *grad_values);
                grad_norm_sum += Utils::clip_grad_norm(params, hp.max_grad_norm);
                optimizer->step(params);

                sample_count += batch;
                ++minibatches;
            }
        }

        ++updates_done;
        steps_done += steps_per_update;

        const double n = static_cast<double>(std::max<size_t>(1, sample_count));
        stats.update = updates_done;
        stats.steps = steps_done;
        stats.policy_loss = static_cast<float>(policy_loss_sum / n);
        stats.value_loss = static_cast<float>(value_loss_sum / n);
        stats.entropy = static_cast<float>(entropy_sum / n);
        stats.approx_kl = static_cast<float>(kl_sum / n);
        stats.clip_fraction = static_cast<float>(clip_sum / n);
        stats.grad_norm = static_cast<float>(grad_norm_sum / std::max(1, minibatches));
        outcome.history.push_back(stats);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        std::ostringstream oss;
        oss << "Update " << updates_done << "/" << total_updates
            << " reward=" << stats.mean_reward
            << " episodes=" << stats.episodes
            << " ep_return=" << stats.mean_episode_return
            << " pi_loss=" << stats.policy_loss
            << " v_loss=" << stats.value_loss
            << " entropy=" << stats.entropy
            << " kl=" << stats.approx_kl
            << " clip=" << stats.clip_fraction
            << " (" << elapsed << " ms)";
        logger_.info(oss.str());

        if (progress_callback_) {
            progress_callback_(stats);
        }

        if (options_.checkpoint_every > 0 && updates_done % options_.checkpoint_every == 0) {
            last_checkpoint = store.update_path(updates_done);
            store.save(last_checkpoint, *policy_, *optimizer, snapshot());
            store.prune(options_.keep_checkpoints);
        }
    }

    outcome.checkpoint_path = store.final_path();
    store.save(outcome.checkpoint_path, *policy_, *optimizer, snapshot());
    outcome.updates_completed = updates_done;
    outcome.steps_completed = steps_done;

    logger_.info("Training finished after " + std::to_string(updates_done) + " updates; policy at " +
                 outcome.checkpoint_path);
    return outcome;
}

} // namespace RL
} // namespace SpecOpt
