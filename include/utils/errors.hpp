#pragma once

#include <stdexcept>
#include <string>

namespace SpecOpt {
namespace Utils {

// Root of every error raised by the optimization engine
class SpecOptError : public std::runtime_error {
public:
    explicit SpecOptError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed design specification (missing or ill-typed required fields).
// Rejects the single request or episode that carried it.
class InvalidSpec : public SpecOptError {
public:
    InvalidSpec(const std::string& spec_id, const std::string& reason)
        : SpecOptError("Invalid spec" + (spec_id.empty() ? std::string() : " '" + spec_id + "'") +
                       ": " + reason),
          spec_id_(spec_id), reason_(reason) {}

    const std::string& spec_id() const { return spec_id_; }
    const std::string& reason() const { return reason_; }

private:
    std::string spec_id_;
    std::string reason_;
};

// Reward model or policy checkpoint missing, corrupt or of incompatible shape
class ModelUnavailable : public SpecOptError {
public:
    ModelUnavailable(const std::string& checkpoint_path, const std::string& reason)
        : SpecOptError("Model unavailable (" + checkpoint_path + "): " + reason),
          checkpoint_path_(checkpoint_path) {}

    const std::string& checkpoint_path() const { return checkpoint_path_; }

private:
    std::string checkpoint_path_;
};

// API misuse, e.g. stepping an environment that is not READY
class InvalidState : public SpecOptError {
public:
    explicit InvalidState(const std::string& message) : SpecOptError(message) {}
};

// Training stopped between updates; resume from last_checkpoint()
class TrainingInterrupted : public SpecOptError {
public:
    TrainingInterrupted(const std::string& last_checkpoint, int updates_completed)
        : SpecOptError("Training interrupted after " + std::to_string(updates_completed) +
                       " updates (last checkpoint: " +
                       (last_checkpoint.empty() ? std::string("none") : last_checkpoint) + ")"),
          last_checkpoint_(last_checkpoint), updates_completed_(updates_completed) {}

    const std::string& last_checkpoint() const { return last_checkpoint_; }
    int updates_completed() const { return updates_completed_; }

private:
    std::string last_checkpoint_;
    int updates_completed_;
};

} // namespace Utils
} // namespace SpecOpt
