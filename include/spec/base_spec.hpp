#pragma once

#include "spec/design_spec.hpp"
#include <string>
#include <vector>

namespace SpecOpt {
namespace Spec {

/**
 * Training starting point: prompt plus the raw spec document.
 * The spec stays unparsed so one malformed entry only disqualifies itself
 * when an environment tries to start from it.
 */
struct BaseSpec {
    std::string spec_id;
    std::string prompt;
    json spec;

    static BaseSpec from_spec(std::string spec_id, std::string prompt, const DesignSpecification& spec);

    // Throws Utils::InvalidSpec tagged with spec_id
    DesignSpecification parse() const;

    json to_json() const;
};

/**
 * Read a JSON array of {spec_id, prompt, spec}. Entries without spec_id get
 * "base_<index>". Throws std::runtime_error when the file cannot be read or
 * is not an array.
 */
std::vector<BaseSpec> load_base_specs(const std::string& path);

} // namespace Spec
} // namespace SpecOpt
