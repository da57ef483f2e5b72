#include "spec/base_spec.hpp"
#include <fstream>
#include <stdexcept>

namespace SpecOpt {
namespace Spec {

BaseSpec BaseSpec::from_spec(std::string spec_id, std::string prompt, const DesignSpecification& spec) {
    return BaseSpec{std::move(spec_id), std::move(prompt), spec.to_json()};
}

DesignSpecification BaseSpec::parse() const {
    return DesignSpecification::from_json(spec, spec_id);
}

json BaseSpec::to_json() const {
    return json{{"spec_id", spec_id}, {"prompt", prompt}, {"spec", spec}};
}

std::vector<BaseSpec> load_base_specs(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open base spec file: " + path);
    }

    json root;
    try {
        file >> root;
    } catch (const json::exception& e) {
        throw std::runtime_error("Base spec file " + path + " is not valid JSON: " + e.what());
    }
    if (!root.is_array()) {
        throw std::runtime_error("Base spec file " + path + " must hold a JSON array");
    }

    std::vector<BaseSpec> specs;
    specs.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        const json& entry = root[i];
        BaseSpec base;
        base.spec_id = "base_" + std::to_string(i);
        if (entry.is_object()) {
            if (entry.contains("spec_id") && entry["spec_id"].is_string()) {
                base.spec_id = entry["spec_id"].get<std::string>();
            }
            if (entry.contains("prompt") && entry["prompt"].is_string()) {
                base.prompt = entry["prompt"].get<std::string>();
            }
            base.spec = entry.contains("spec") ? entry["spec"] : json();
        } else {
            base.spec = entry;
        }
        specs.push_back(std::move(base));
    }
    return specs;
}

} // namespace Spec
} // namespace SpecOpt
