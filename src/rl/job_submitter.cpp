#include "rl/job_submitter.hpp"
#include "utils/logger.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace SpecOpt {
namespace RL {

namespace fs = std::filesystem;

SpoolJobSubmitter::SpoolJobSubmitter(std::string spool_dir) : spool_dir_(std::move(spool_dir)) {
}

std::string SpoolJobSubmitter::make_job_id() {
    static std::atomic<unsigned> counter{0};
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return "ppo-" + std::to_string(ms) + "-" + std::to_string(counter.fetch_add(1));
}

std::string SpoolJobSubmitter::submit(const nlohmann::json& request) {
    nlohmann::json job = request;
    std::string job_id;
    if (job.contains("job_id") && job["job_id"].is_string() && !job["job_id"].get<std::string>().empty()) {
        job_id = job["job_id"].get<std::string>();
    } else {
        job_id = make_job_id();
        job["job_id"] = job_id;
    }

    fs::create_directories(spool_dir_);
    const fs::path target = fs::path(spool_dir_) / (job_id + ".json");
    const std::string tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write job request: " + tmp);
        }
        out << job.dump(2) << "\n";
        if (!out) {
            throw std::runtime_error("Failed writing job request: " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), target.string().c_str()) != 0) {
        std::remove(tmp.c_str());
        throw std::runtime_error("Cannot publish job request " + target.string());
    }

    LOG_INFO("JOBS", "Submitted " + job_id + " to " + target.string());
    return job_id;
}

} // namespace RL
} // namespace SpecOpt
