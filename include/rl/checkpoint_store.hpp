#pragma once

#include "model/policy.hpp"
#include "utils/optimizer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SpecOpt {
namespace RL {

// Everything besides weights and optimizer moments needed to resume exactly
struct TrainerState {
    int updates_completed = 0;
    uint64_t steps_completed = 0;
    std::string trainer_rng;                // std::mt19937 textual state
    std::vector<std::string> env_rngs;
    std::vector<uint32_t> cursors;          // next base spec per env
};

struct CheckpointRef {
    int update;
    std::string path;
};

/**
 * Training checkpoints in one directory:
 *   policy_update_<N>.ckpt   periodic, resumable
 *   policy.ckpt              final
 *
 * Files share the policy checkpoint layout (header, weights) followed by
 * the trainer state, so the service can load either one.
 */
class CheckpointStore {
public:
    explicit CheckpointStore(std::string directory);

    std::string update_path(int update) const;
    std::string final_path() const;

    // Highest-numbered periodic checkpoint, if any
    std::optional<CheckpointRef> latest() const;

    void save(const std::string& path,
              const Model::ActorCriticPolicy& policy,
              const Utils::Optimizer& optimizer,
              const TrainerState& state) const;

    /**
     * Restore policy weights and optimizer state in place, return the
     * trainer state. Throws Utils::ModelUnavailable on a missing, corrupt
     * or mismatched file.
     */
    TrainerState load(const std::string& path,
                      Model::ActorCriticPolicy& policy,
                      Utils::Optimizer& optimizer) const;

    // Delete all but the newest keep_last periodic checkpoints (0 keeps everything)
    void prune(int keep_last) const;

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;

    std::vector<CheckpointRef> list() const;
};

} // namespace RL
} // namespace SpecOpt
