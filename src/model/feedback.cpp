#include "model/feedback.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace SpecOpt {
namespace Model {

Spec::json FeedbackRecord::to_json() const {
    Spec::json j;
    j["prompt"] = prompt;
    j["spec_a"] = spec_a.to_json();
    j["spec_b"] = spec_b.to_json();
    if (!preference.empty()) {
        j["preference"] = preference;
    }
    if (rating_a) j["rating_a"] = *rating_a;
    if (rating_b) j["rating_b"] = *rating_b;
    return j;
}

FeedbackRecord FeedbackRecord::from_json(const Spec::json& j) {
    if (!j.is_object()) {
        throw Utils::InvalidSpec("feedback", "record must be a JSON object");
    }
    FeedbackRecord record;
    record.prompt = j.value("prompt", std::string());
    if (!j.contains("spec_a") || !j.contains("spec_b")) {
        throw Utils::InvalidSpec("feedback", "record needs spec_a and spec_b");
    }
    record.spec_a = Spec::DesignSpecification::from_json(j["spec_a"], "spec_a");
    record.spec_b = Spec::DesignSpecification::from_json(j["spec_b"], "spec_b");

    if (j.contains("preference") && j["preference"].is_string()) {
        record.preference = j["preference"].get<std::string>();
        if (record.preference == "a") record.preference = "A";
        if (record.preference == "b") record.preference = "B";
    }
    if (j.contains("rating_a") && j["rating_a"].is_number()) {
        record.rating_a = j["rating_a"].get<double>();
    }
    if (j.contains("rating_b") && j["rating_b"].is_number()) {
        record.rating_b = j["rating_b"].get<double>();
    }
    return record;
}

std::optional<PreferencePair> to_preference_pair(const FeedbackRecord& record, double min_rating_delta) {
    if (record.preference == "A") {
        return PreferencePair{record.prompt, record.spec_a, record.spec_b};
    }
    if (record.preference == "B") {
        return PreferencePair{record.prompt, record.spec_b, record.spec_a};
    }
    if (record.rating_a && record.rating_b) {
        double delta = *record.rating_b - *record.rating_a;
        if (std::fabs(delta) >= min_rating_delta && delta != 0.0) {
            if (delta > 0.0) {
                return PreferencePair{record.prompt, record.spec_b, record.spec_a};
            }
            return PreferencePair{record.prompt, record.spec_a, record.spec_b};
        }
    }
    return std::nullopt;
}

FeedbackLog::FeedbackLog(std::string path) : path_(std::move(path)) {
}

void FeedbackLog::append(const FeedbackRecord& record) const {
    std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open feedback log: " + path_);
    }
    out << record.to_json().dump() << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing feedback log: " + path_);
    }
}

std::vector<FeedbackRecord> FeedbackLog::read_all() const {
    std::vector<FeedbackRecord> records;
    std::ifstream in(path_);
    if (!in.is_open()) {
        LOG_WARNING("FEEDBACK", "Feedback log not found: " + path_);
        return records;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            records.push_back(FeedbackRecord::from_json(Spec::json::parse(line)));
        } catch (const Spec::json::exception& e) {
            LOG_WARNING("FEEDBACK", path_ + ":" + std::to_string(line_no) + " skipped: " + e.what());
        } catch (const Utils::InvalidSpec& e) {
            LOG_WARNING("FEEDBACK", path_ + ":" + std::to_string(line_no) + " skipped: " + e.what());
        }
    }
    LOG_INFO("FEEDBACK", "Read " + std::to_string(records.size()) + " records from " + path_);
    return records;
}

} // namespace Model
} // namespace SpecOpt
