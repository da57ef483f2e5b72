#pragma once

#include "spec/design_spec.hpp"
#include <optional>
#include <string>
#include <vector>

namespace SpecOpt {
namespace Model {

// Human judgement over two candidate specs for one prompt
struct FeedbackRecord {
    std::string prompt;
    Spec::DesignSpecification spec_a;
    Spec::DesignSpecification spec_b;
    std::string preference;             // "A", "B" or empty
    std::optional<double> rating_a;
    std::optional<double> rating_b;

    Spec::json to_json() const;
    static FeedbackRecord from_json(const Spec::json& j);
};

// Ordered training pair derived from a record
struct PreferencePair {
    std::string prompt;
    Spec::DesignSpecification preferred;
    Spec::DesignSpecification other;
};

/**
 * Turn a record into a pair: the explicit preference wins, otherwise the
 * ratings decide when they differ by at least min_rating_delta.
 * Records with neither are skipped (nullopt).
 */
std::optional<PreferencePair> to_preference_pair(const FeedbackRecord& record, double min_rating_delta);

/**
 * Append-only JSON-lines store of feedback records
 */
class FeedbackLog {
public:
    explicit FeedbackLog(std::string path);

    void append(const FeedbackRecord& record) const;

    // Malformed lines are logged and skipped
    std::vector<FeedbackRecord> read_all() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace Model
} // namespace SpecOpt
