#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace SpecOpt {
namespace RL {

/**
 * Hands training runs that are too large for this process to the external
 * scheduler. submit() returns an opaque handle identifying the job.
 */
class JobSubmitter {
public:
    virtual ~JobSubmitter() = default;

    virtual std::string submit(const nlohmann::json& request) = 0;
};

/**
 * Writes each request as <job_id>.json into a spool directory watched by the
 * scheduler. The file appears atomically (temp file + rename).
 */
class SpoolJobSubmitter : public JobSubmitter {
public:
    explicit SpoolJobSubmitter(std::string spool_dir);

    // Uses request["job_id"] when present, otherwise assigns one
    std::string submit(const nlohmann::json& request) override;

    const std::string& spool_dir() const { return spool_dir_; }

private:
    std::string spool_dir_;

    static std::string make_job_id();
};

} // namespace RL
} // namespace SpecOpt
