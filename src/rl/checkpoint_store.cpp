#include "rl/checkpoint_store.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/serialization.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>

namespace SpecOpt {
namespace RL {

namespace fs = std::filesystem;

CheckpointStore::CheckpointStore(std::string directory) : directory_(std::move(directory)) {
}

std::string CheckpointStore::update_path(int update) const {
    return (fs::path(directory_) / ("policy_update_" + std::to_string(update) + ".ckpt")).string();
}

std::string CheckpointStore::final_path() const {
    return (fs::path(directory_) / "policy.ckpt").string();
}

std::vector<CheckpointRef> CheckpointStore::list() const {
    std::vector<CheckpointRef> refs;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return refs;
    }

    static const std::regex pattern(R"(policy_update_(\d+)\.ckpt)");
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::smatch match;
        std::string name = entry.path().filename().string();
        if (std::regex_match(name, match, pattern)) {
            refs.push_back(CheckpointRef{std::stoi(match[1].str()), entry.path().string()});
        }
    }
    std::sort(refs.begin(), refs.end(),
              [](const CheckpointRef& a, const CheckpointRef& b) { return a.update < b.update; });
    return refs;
}

std::optional<CheckpointRef> CheckpointStore::latest() const {
    auto refs = list();
    if (refs.empty()) {
        return std::nullopt;
    }
    return refs.back();
}

void CheckpointStore::save(const std::string& path,
                           const Model::ActorCriticPolicy& policy,
                           const Utils::Optimizer& optimizer,
                           const TrainerState& state) const {
    using Utils::Serialization;

    Serialization::write_file_atomic(path, [&](std::ostream& out) {
        Serialization::write_header(out, Serialization::KIND_POLICY);
        policy.write_weights(out);

        Serialization::write_u32(out, 1);   // trainer state follows
        Serialization::write_i32(out, state.updates_completed);
        Serialization::write_u64(out, state.steps_completed);
        Serialization::write_string(out, state.trainer_rng);
        Serialization::write_u32(out, static_cast<uint32_t>(state.env_rngs.size()));
        for (size_t i = 0; i < state.env_rngs.size(); ++i) {
            Serialization::write_string(out, state.env_rngs[i]);
            Serialization::write_u32(out, i < state.cursors.size() ? state.cursors[i] : 0u);
        }
        Serialization::write_string(out, optimizer.name());
        optimizer.save_state(out);
    });
    LOG_INFO("CHECKPOINT", "Wrote " + path + " (update " + std::to_string(state.updates_completed) + ")");
}

TrainerState CheckpointStore::load(const std::string& path,
                                   Model::ActorCriticPolicy& policy,
                                   Utils::Optimizer& optimizer) const {
    using Utils::Serialization;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw Utils::ModelUnavailable(path, "checkpoint not found");
    }
    if (!Serialization::validate_checksum(path)) {
        throw Utils::ModelUnavailable(path, "checksum mismatch (truncated or corrupt file)");
    }

    try {
        Serialization::read_header(in, Serialization::KIND_POLICY);
        policy.read_weights(in);

        if (Serialization::read_u32(in) != 1) {
            throw Utils::ModelUnavailable(path, "checkpoint carries no trainer state");
        }

        TrainerState state;
        state.updates_completed = Serialization::read_i32(in);
        state.steps_completed = Serialization::read_u64(in);
        state.trainer_rng = Serialization::read_string(in);
        uint32_t env_count = Serialization::read_u32(in);
        for (uint32_t i = 0; i < env_count; ++i) {
            state.env_rngs.push_back(Serialization::read_string(in));
            state.cursors.push_back(Serialization::read_u32(in));
        }

        std::string optimizer_name = Serialization::read_string(in);
        if (optimizer_name != optimizer.name()) {
            throw Utils::ModelUnavailable(path, "optimizer " + optimizer_name + " in checkpoint, " +
                                          optimizer.name() + " configured");
        }
        optimizer.load_state(in);

        LOG_INFO("CHECKPOINT", "Restored " + path + " (update " + std::to_string(state.updates_completed) + ")");
        return state;
    } catch (const Utils::ModelUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw Utils::ModelUnavailable(path, e.what());
    }
}

void CheckpointStore::prune(int keep_last) const {
    if (keep_last <= 0) {
        return;
    }
    auto refs = list();
    if (refs.size() <= static_cast<size_t>(keep_last)) {
        return;
    }
    for (size_t i = 0; i + static_cast<size_t>(keep_last) < refs.size(); ++i) {
        std::error_code ec;
        fs::remove(refs[i].path, ec);
        if (ec) {
            LOG_WARNING("CHECKPOINT", "Could not remove " + refs[i].path + ": " + ec.message());
        }
    }
}

} // namespace RL
} // namespace SpecOpt
