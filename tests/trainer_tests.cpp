#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include "rl/checkpoint_store.hpp"
#include "rl/job_submitter.hpp"
#include "rl/ppo_trainer.hpp"
#include "rl/rollout_buffer.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"

using namespace SpecOpt;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("specopt_trainer_tests_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

Model::RewardModelHandle make_reward_model() {
    auto model = std::make_shared<Model::RewardModel>(64, 16);
    model->initialize(77);
    return model;
}

std::vector<Spec::BaseSpec> base_specs() {
    std::vector<Spec::BaseSpec> bases;
    bases.push_back(Spec::BaseSpec{"living", "warm modern living room", Spec::json::parse(R"({
        "objects": [
            {"id": "floor_1", "material": "wood_basic", "dimensions": {"width": 4, "depth": 3, "height": 0.1}},
            {"id": "sofa_1", "material": "fabric_basic"}
        ],
        "scene": {"style": "modern"}
    })")});
    bases.push_back(Spec::BaseSpec{"kitchen", "bright kitchen", Spec::json::parse(R"({
        "objects": [{"id": "countertop_1", "material": "laminate"}],
        "scene": {"style": "minimal", "budget": 2000}
    })")});
    return bases;
}

Spec::BaseSpec broken_base() {
    return Spec::BaseSpec{"broken", "anything", Spec::json::parse(R"({"objects": [{"id": "x_1"}]})")};
}

RL::PPOHyperparameters small_hyperparameters() {
    RL::PPOHyperparameters hp;
    hp.rollout_length = 8;
    hp.n_epochs = 2;
    hp.minibatch_size = 8;
    hp.hidden_dim = 16;
    hp.learning_rate = 1e-3f;
    hp.seed = 3;
    return hp;
}

RL::TrainerOptions small_options(const fs::path& dir) {
    RL::TrainerOptions options;
    options.output_dir = (dir / "ckpt").string();
    options.job_spool_dir = (dir / "jobs").string();
    options.checkpoint_every = 2;
    options.num_threads = 2;
    options.environment.horizon = 4;
    return options;
}

// Records requests instead of spooling them
class RecordingSubmitter : public RL::JobSubmitter {
public:
    std::string submit(const nlohmann::json& request) override {
        requests.push_back(request);
        return "job-" + std::to_string(requests.size());
    }

    std::vector<nlohmann::json> requests;
};

float max_weight_difference(const std::string& a, const std::string& b) {
    auto pa = Model::ActorCriticPolicy::load(a, 64, 93);
    auto pb = Model::ActorCriticPolicy::load(b, 64, 93);
    auto params_a = pa->parameters();
    auto params_b = pb->parameters();
    float worst = 0.0f;
    for (size_t i = 0; i < params_a.size(); ++i) {
        const float* da = params_a[i]->data()->data();
        const float* db = params_b[i]->data()->data();
        for (size_t j = 0; j < params_a[i]->data()->size(); ++j) {
            worst = std::max(worst, std::fabs(da[j] - db[j]));
        }
    }
    return worst;
}

} // namespace

void test_rollout_buffer_gae() {
    std::cout << "Testing rollout buffer advantages..." << std::endl;

    RL::RolloutBuffer buffer(3, 2);
    for (int t = 0; t < 3; ++t) {
        for (int e = 0; e < 2; ++e) {
            RL::Transition tr;
            tr.reward = 1.0f;
            tr.value = 0.5f;
            buffer.set(t, e, tr);
        }
    }
    // Env 1 terminates at t = 1
    RL::Transition end;
    end.reward = 1.0f;
    end.value = 0.5f;
    end.episode_end = true;
    end.bootstrap_value = 0.0f;
    buffer.set(1, 1, end);
    buffer.set_last_value(0, 0.5f);
    buffer.set_last_value(1, 0.5f);

    buffer.compute_advantages(0.9f, 1.0f, false);

    // Env 0: delta = 1 + 0.9 * 0.5 - 0.5 = 0.95 at every step
    assert(std::fabs(buffer.advantage(2 * 2 + 0) - 0.95f) < 1e-5f);
    assert(std::fabs(buffer.advantage(1 * 2 + 0) - 1.805f) < 1e-5f);
    assert(std::fabs(buffer.advantage(0 * 2 + 0) - 2.5745f) < 1e-5f);
    assert(std::fabs(buffer.return_at(0) - 3.0745f) < 1e-5f);

    // Env 1: the trace is cut at the episode end
    assert(std::fabs(buffer.advantage(1 * 2 + 1) - 0.5f) < 1e-5f);
    assert(std::fabs(buffer.advantage(0 * 2 + 1) - 1.4f) < 1e-5f);
    assert(std::fabs(buffer.advantage(2 * 2 + 1) - 0.95f) < 1e-5f);

    assert(buffer.mean_reward() == 1.0f);

    // Normalized advantages have zero mean and unit variance
    buffer.compute_advantages(0.9f, 0.95f, true);
    double mean = 0.0, sq = 0.0;
    for (size_t i = 0; i < buffer.size(); ++i) {
        mean += buffer.advantage(i);
        sq += buffer.advantage(i) * buffer.advantage(i);
    }
    mean /= buffer.size();
    assert(std::fabs(mean) < 1e-5);
    assert(std::fabs(sq / buffer.size() - 1.0) < 1e-3);

    bool threw = false;
    try {
        buffer.set(3, 0, RL::Transition());
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Rollout buffer tests passed" << std::endl;
}

void test_training_run() {
    std::cout << "Testing local training run..." << std::endl;

    fs::path dir = scratch_dir("run");
    RL::PPOTrainer trainer(make_reward_model(), small_options(dir));

    int callbacks = 0;
    trainer.set_progress_callback([&](const RL::UpdateStats& stats) {
        ++callbacks;
        assert(stats.update == callbacks);
        assert(std::isfinite(stats.policy_loss));
        assert(std::isfinite(stats.value_loss));
        assert(stats.entropy > 0.0f);
    });

    // 2 envs x 8 steps per update, 64 steps -> 4 updates
    auto outcome = trainer.train(base_specs(), 64, 2, small_hyperparameters());
    assert(!outcome.is_job());
    assert(outcome.updates_completed == 4);
    assert(outcome.steps_completed == 64);
    assert(outcome.history.size() == 4);
    assert(callbacks == 4);

    RL::CheckpointStore store((dir / "ckpt").string());
    assert(outcome.checkpoint_path == store.final_path());
    assert(fs::exists(store.final_path()));
    assert(fs::exists(store.update_path(2)));
    assert(fs::exists(store.update_path(4)));
    assert(!fs::exists(store.update_path(1)));
    assert(store.latest()->update == 4);

    // The final checkpoint loads as a plain policy
    auto policy = Model::ActorCriticPolicy::load(outcome.checkpoint_path, 64, 93);
    assert(policy->hidden_dim() == 16);
    assert(trainer.policy() != nullptr);

    // Steps that are not a multiple of an update round up
    RL::TrainerOptions options = small_options(dir / "round");
    options.checkpoint_every = 0;
    RL::PPOTrainer rounding(make_reward_model(), options);
    auto rounded = rounding.train(base_specs(), 20, 2, small_hyperparameters());
    assert(rounded.updates_completed == 2);
    assert(!RL::CheckpointStore(options.output_dir).latest());

    fs::remove_all(dir);
    std::cout << "  ✓ Local training tests passed" << std::endl;
}

void test_checkpoint_pruning() {
    std::cout << "Testing checkpoint pruning..." << std::endl;

    fs::path dir = scratch_dir("prune");
    RL::TrainerOptions options = small_options(dir);
    options.checkpoint_every = 1;
    options.keep_checkpoints = 2;

    RL::PPOTrainer trainer(make_reward_model(), options);
    trainer.train(base_specs(), 64, 2, small_hyperparameters());

    RL::CheckpointStore store(options.output_dir);
    assert(!fs::exists(store.update_path(1)));
    assert(!fs::exists(store.update_path(2)));
    assert(fs::exists(store.update_path(3)));
    assert(fs::exists(store.update_path(4)));

    fs::remove_all(dir);
    std::cout << "  ✓ Checkpoint pruning tests passed" << std::endl;
}

void test_cancel_and_resume() {
    std::cout << "Testing cancellation and resume..." << std::endl;

    fs::path dir = scratch_dir("resume");
    const auto hp = small_hyperparameters();

    // Uninterrupted reference run
    RL::TrainerOptions reference_options = small_options(dir / "reference");
    RL::PPOTrainer reference(make_reward_model(), reference_options);
    auto full = reference.train(base_specs(), 64, 2, hp);

    // Interrupted after the second update
    RL::TrainerOptions options = small_options(dir / "interrupted");
    RL::CancellationToken cancel;
    RL::PPOTrainer first(make_reward_model(), options);
    first.set_progress_callback([&](const RL::UpdateStats& stats) {
        if (stats.update == 2) {
            cancel.cancel();
        }
    });

    bool interrupted = false;
    try {
        first.train(base_specs(), 64, 2, hp, &cancel);
    } catch (const Utils::TrainingInterrupted& e) {
        interrupted = true;
        assert(e.updates_completed() == 2);
        assert(e.last_checkpoint() == RL::CheckpointStore(options.output_dir).update_path(2));
    }
    assert(interrupted);
    assert(!fs::exists(RL::CheckpointStore(options.output_dir).final_path()));

    // Resume picks up at update 3 and ends where the reference run ended
    options.resume = true;
    RL::PPOTrainer second(make_reward_model(), options);
    auto resumed = second.train(base_specs(), 64, 2, hp);
    assert(resumed.updates_completed == 4);
    assert(resumed.steps_completed == 64);
    assert(resumed.history.size() == 2);
    assert(resumed.history.front().update == 3);

    assert(max_weight_difference(full.checkpoint_path, resumed.checkpoint_path) < 1e-6f);

    // A different env count cannot continue this run
    RL::PPOTrainer mismatched(make_reward_model(), options);
    bool threw = false;
    try {
        mismatched.train(base_specs(), 64, 3, hp);
    } catch (const Utils::InvalidState&) {
        threw = true;
    }
    assert(threw);

    // Resume with an empty directory starts fresh
    RL::TrainerOptions fresh_options = small_options(dir / "fresh");
    fresh_options.resume = true;
    RL::PPOTrainer fresh(make_reward_model(), fresh_options);
    assert(fresh.train(base_specs(), 32, 2, hp).updates_completed == 2);

    // Cancelled before the first update
    RL::CancellationToken early;
    early.cancel();
    RL::PPOTrainer never(make_reward_model(), small_options(dir / "never"));
    threw = false;
    try {
        never.train(base_specs(), 32, 2, hp, &early);
    } catch (const Utils::TrainingInterrupted& e) {
        threw = true;
        assert(e.updates_completed() == 0);
        assert(e.last_checkpoint().empty());
    }
    assert(threw);

    fs::remove_all(dir);
    std::cout << "  ✓ Cancellation and resume tests passed" << std::endl;
}

void test_job_routing() {
    std::cout << "Testing job routing..." << std::endl;

    fs::path dir = scratch_dir("jobs");
    RL::TrainerOptions options = small_options(dir);
    options.local_step_threshold = 1000;
    options.reward_model_path = "models/reward.ckpt";

    // Injected submitter
    auto recorder = std::make_shared<RecordingSubmitter>();
    RL::PPOTrainer trainer(make_reward_model(), options, recorder);
    auto outcome = trainer.train(base_specs(), 5000, 4, small_hyperparameters());
    assert(outcome.is_job());
    assert(outcome.job_handle == "job-1");
    assert(outcome.updates_completed == 0);
    assert(recorder->requests.size() == 1);
    const auto& request = recorder->requests[0];
    assert(request["kind"] == "ppo_train");
    assert(request["steps"] == 5000);
    assert(request["env_count"] == 4);
    assert(request["reward_model_path"] == "models/reward.ckpt");
    assert(request["base_specs"].size() == 2);
    assert(request["hyperparameters"]["rollout_length"] == 8);
    assert(!fs::exists(options.output_dir));

    // Default spool directory
    RL::PPOTrainer spooled(make_reward_model(), options);
    auto job = spooled.train(base_specs(), 1000, 2, small_hyperparameters());
    assert(job.is_job());
    fs::path spool_file = fs::path(options.job_spool_dir) / (job.job_handle + ".json");
    assert(fs::exists(spool_file));
    std::ifstream in(spool_file);
    auto spooled_request = nlohmann::json::parse(in);
    assert(spooled_request["job_id"] == job.job_handle);
    assert(spooled_request["steps"] == 1000);

    // Explicit job ids are kept
    RL::SpoolJobSubmitter submitter(options.job_spool_dir);
    assert(submitter.submit({{"job_id", "nightly"}}) == "nightly");
    assert(fs::exists(fs::path(options.job_spool_dir) / "nightly.json"));

    fs::remove_all(dir);
    std::cout << "  ✓ Job routing tests passed" << std::endl;
}

void test_training_errors() {
    std::cout << "Testing training errors..." << std::endl;

    fs::path dir = scratch_dir("errors");

    // No reward model: fails before touching specs or the filesystem
    {
        RL::PPOTrainer trainer(nullptr, small_options(dir));
        bool threw = false;
        try {
            trainer.train({broken_base()}, 64, 2, small_hyperparameters());
        } catch (const Utils::ModelUnavailable&) {
            threw = true;
        }
        assert(threw);
        assert(!fs::exists(dir / "ckpt"));
    }

    // Every base spec malformed
    {
        RL::PPOTrainer trainer(make_reward_model(), small_options(dir));
        bool threw = false;
        try {
            trainer.train({broken_base(), broken_base()}, 64, 2, small_hyperparameters());
        } catch (const Utils::InvalidSpec&) {
            threw = true;
        }
        assert(threw);
    }

    // A malformed base spec among valid ones is skipped
    {
        auto bases = base_specs();
        bases.insert(bases.begin(), broken_base());
        RL::PPOTrainer trainer(make_reward_model(), small_options(dir / "mixed"));
        auto outcome = trainer.train(bases, 32, 3, small_hyperparameters());
        assert(outcome.updates_completed == 2);
    }

    // Bad arguments
    {
        RL::PPOTrainer trainer(make_reward_model(), small_options(dir));
        bool threw = false;
        try {
            trainer.train(base_specs(), 64, 0, small_hyperparameters());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    fs::remove_all(dir);
    std::cout << "  ✓ Training error tests passed" << std::endl;
}

int main() {
    Utils::Logger::instance().set_console_output(false);

    std::cout << "\n=== Running Trainer Tests ===\n" << std::endl;

    test_rollout_buffer_gae();
    test_training_run();
    test_checkpoint_pruning();
    test_cancel_and_resume();
    test_job_routing();
    test_training_errors();

    std::cout << "\n=== All Trainer Tests Passed ===\n" << std::endl;

    return 0;
}
