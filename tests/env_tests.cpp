#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include "env/spec_env.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"

using namespace SpecOpt;

namespace {

Model::RewardModelHandle make_reward_model(int buckets = 64) {
    auto model = std::make_shared<Model::RewardModel>(buckets, 16);
    model->initialize(31);
    return model;
}

Spec::DesignSpecification budget_spec(double budget) {
    Spec::DesignSpecification spec = Spec::DesignSpecification::from_string(R"({
        "objects": [
            {"id": "floor_1", "material": "wood_basic", "dimensions": {"width": 1, "depth": 1, "height": 0.1}},
            {"id": "wall_1", "material": "paint_basic", "dimensions": {"width": 11.5, "depth": 0.15, "height": 2.7}}
        ],
        "scene": {"style": "scandinavian"}
    })");
    spec.scene().budget = budget;
    return spec;
}

Spec::DesignSpecification full_spec(int count) {
    Spec::DesignSpecification spec;
    for (int i = 1; i <= count; ++i) {
        Spec::DesignObject obj;
        obj.id = "chair_" + std::to_string(i);
        obj.type = "chair";
        obj.material = "wood_basic";
        spec.objects().push_back(obj);
    }
    return spec;
}

template<typename F>
bool throws_invalid_state(F&& f) {
    try {
        f();
    } catch (const Utils::InvalidState&) {
        return true;
    }
    return false;
}

} // namespace

void test_environment_lifecycle() {
    std::cout << "Testing environment lifecycle..." << std::endl;

    bool threw = false;
    try {
        Env::SpecEnvironment env(nullptr);
    } catch (const Utils::ModelUnavailable&) {
        threw = true;
    }
    assert(threw);

    auto model = make_reward_model();
    Env::SpecEnvironment env(model);
    assert(env.state() == Env::EnvState::Uninitialized);
    assert(env.observation_size() == 64);
    assert(throws_invalid_state([&] { env.step(0); }));

    auto spec = budget_spec(0.0);
    auto obs = env.reset(spec, "calm room");
    assert(obs.size() == 64);
    assert(env.state() == Env::EnvState::Ready);
    assert(env.steps_taken() == 0);
    assert(env.current_score() == model->score("calm room", spec));

    // NoOp ends the episode with the current score
    auto result = env.step(0);
    assert(result.terminated && !result.truncated);
    assert(result.reward == env.current_score());
    assert(result.observation == obs);
    assert(!result.info.applied);
    assert(env.state() == Env::EnvState::Terminal);
    assert(throws_invalid_state([&] { env.step(0); }));

    // Reset makes the environment usable again
    env.reset(spec, "calm room");
    assert(env.state() == Env::EnvState::Ready);

    // Malformed specs built in code are rejected at reset
    Spec::DesignSpecification duplicated = full_spec(2);
    duplicated.objects()[1].id = duplicated.objects()[0].id;
    threw = false;
    try {
        env.reset(duplicated, "");
    } catch (const Utils::InvalidSpec&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Env::parse_reward_mode("bogus");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Environment lifecycle tests passed" << std::endl;
}

void test_environment_steps() {
    std::cout << "Testing environment steps..." << std::endl;

    auto model = make_reward_model();
    Env::SpecEnvironment env(model);
    const auto spec = budget_spec(0.0);
    const auto original = spec;
    env.reset(spec, "calm room");

    // SetMaterial(slot 0, wood_oak)
    auto result = env.step(2);
    assert(!result.terminated && !result.truncated);
    assert(result.info.applied);
    assert(result.info.violation.empty());
    assert(result.info.step == 1);
    assert(env.current_spec().objects()[0].material == "wood_oak");
    assert(spec == original);

    float expected = model->score("calm room", env.current_spec());
    assert(result.reward == expected);
    assert(result.info.score == expected);
    assert(result.observation == env.encoder().encode("calm room", env.current_spec()));

    // Slot 5 does not exist: degrades to NoOp and terminates
    auto degraded = env.step(1 + 5 * 8);
    assert(degraded.info.degraded);
    assert(degraded.terminated);
    assert(env.current_spec().objects()[0].material == "wood_oak");

    std::cout << "  ✓ Environment step tests passed" << std::endl;
}

void test_environment_truncation() {
    std::cout << "Testing environment truncation..." << std::endl;

    Env::EnvironmentOptions options;
    options.horizon = 2;
    Env::SpecEnvironment env(make_reward_model(), Spec::ActionSpaceConfig(), options);
    env.reset(budget_spec(0.0), "");

    // Resize floor down then up
    auto first = env.step(65);
    assert(!first.terminated && !first.truncated);
    auto second = env.step(66);
    assert(!second.terminated);
    assert(second.truncated);
    assert(env.state() == Env::EnvState::Terminal);
    assert(throws_invalid_state([&] { env.step(0); }));

    std::cout << "  ✓ Environment truncation tests passed" << std::endl;
}

void test_environment_constraints() {
    std::cout << "Testing environment hard constraints..." << std::endl;

    auto model = make_reward_model();

    // Budget: marble floor costs 120 against a budget of 25
    {
        Env::SpecEnvironment env(model);
        const auto spec = budget_spec(10000.0);
        auto tight = spec;
        tight.objects().pop_back();
        tight.scene().budget = 25.0;
        env.reset(tight, "luxury");
        float before = env.current_score();

        auto result = env.step(1);
        assert(result.terminated);
        assert(!result.info.violation.empty());
        assert(std::fabs(result.reward - (before - 1.0f)) < 1e-6f);
        assert(env.current_spec() == tight);
        assert(env.state() == Env::EnvState::Terminal);
    }

    // Dimensions: 11.5 m wall grown by 10% exceeds 12 m
    {
        Env::SpecEnvironment env(model);
        env.reset(budget_spec(0.0), "");
        auto result = env.step(65 + 2 + 1);
        assert(result.terminated);
        assert(result.info.violation.find("wall_1") != std::string::npos);
        assert(env.current_spec().objects()[1].dimensions.width == 11.5);
    }

    // Object count: a ninth object
    {
        Env::SpecEnvironment env(model);
        env.reset(full_spec(8), "");
        auto result = env.step(81);
        assert(result.terminated);
        assert(!result.info.violation.empty());
        assert(env.current_spec().object_count() == 8);

        // Removing still works on a full spec
        env.reset(full_spec(8), "");
        auto removed = env.step(85 + 7);
        assert(!removed.terminated);
        assert(env.current_spec().object_count() == 7);
    }

    // check_constraints on its own
    {
        Env::SpecEnvironment env(model);
        assert(env.check_constraints(budget_spec(0.0)).empty());
        auto tiny = budget_spec(0.0);
        tiny.objects()[0].dimensions.height = 0.005;
        assert(!env.check_constraints(tiny).empty());
    }

    std::cout << "  ✓ Environment constraint tests passed" << std::endl;
}

void test_improvement_reward() {
    std::cout << "Testing improvement reward mode..." << std::endl;

    auto model = make_reward_model();
    Env::EnvironmentOptions options;
    options.reward_mode = Env::RewardMode::Improvement;
    options.violation_penalty = -0.5f;
    Env::SpecEnvironment env(model, Spec::ActionSpaceConfig(), options);

    env.reset(budget_spec(0.0), "calm room");
    float before = env.current_score();
    auto result = env.step(2);
    assert(std::fabs(result.reward - (env.current_score() - before)) < 1e-6f);

    auto noop = env.step(0);
    assert(noop.reward == 0.0f);

    auto tight = budget_spec(0.0);
    tight.objects().pop_back();
    tight.scene().budget = 25.0;
    env.reset(tight, "calm room");
    auto violation = env.step(1);
    assert(violation.reward == -0.5f);

    std::cout << "  ✓ Improvement reward tests passed" << std::endl;
}

void test_shared_reward_model() {
    std::cout << "Testing environments sharing a reward model..." << std::endl;

    auto model = make_reward_model();
    Env::SpecEnvironment a(model);
    Env::SpecEnvironment b(model);
    a.reset(budget_spec(0.0), "p");
    b.reset(budget_spec(0.0), "p");

    for (int action : {2, 66, 82}) {
        auto ra = a.step(action);
        auto rb = b.step(action);
        assert(ra.reward == rb.reward);
        assert(ra.observation == rb.observation);
    }
    assert(a.current_spec() == b.current_spec());

    std::cout << "  ✓ Shared reward model tests passed" << std::endl;
}

int main() {
    Utils::Logger::instance().set_console_output(false);

    std::cout << "\n=== Running Environment Tests ===\n" << std::endl;

    test_environment_lifecycle();
    test_environment_steps();
    test_environment_truncation();
    test_environment_constraints();
    test_improvement_reward();
    test_shared_reward_model();

    std::cout << "\n=== All Environment Tests Passed ===\n" << std::endl;

    return 0;
}
