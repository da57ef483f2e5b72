#include "spec/design_spec.hpp"
#include "utils/errors.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace SpecOpt {
namespace Spec {

namespace {

const char* const OBJECT_KEYS[] = {"id", "type", "material", "color", "dimensions"};
const char* const SCENE_KEYS[] = {"style", "estimated_cost", "city", "budget"};

template<size_t N>
bool is_known(const std::string& key, const char* const (&known)[N]) {
    for (const char* k : known) {
        if (key == k) return true;
    }
    return false;
}

std::string optional_string(const json& j, const char* key, const std::string& spec_id,
                            const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::string();
    }
    if (!j[key].is_string()) {
        throw Utils::InvalidSpec(spec_id, where + "." + key + " must be a string");
    }
    return j[key].get<std::string>();
}

double optional_number(const json& j, const char* key, const std::string& spec_id,
                       const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) {
        return 0.0;
    }
    if (!j[key].is_number()) {
        throw Utils::InvalidSpec(spec_id, where + "." + key + " must be a number");
    }
    double value = j[key].get<double>();
    if (!std::isfinite(value)) {
        throw Utils::InvalidSpec(spec_id, where + "." + key + " must be finite");
    }
    return value;
}

Dimensions parse_dimensions(const json& j, const std::string& spec_id, const std::string& where) {
    if (!j.is_object()) {
        throw Utils::InvalidSpec(spec_id, where + " must be an object");
    }
    Dimensions dims;
    dims.width = optional_number(j, "width", spec_id, where);
    dims.depth = optional_number(j, "depth", spec_id, where);
    dims.height = optional_number(j, "height", spec_id, where);
    if (dims.width < 0.0 || dims.depth < 0.0 || dims.height < 0.0) {
        throw Utils::InvalidSpec(spec_id, where + " must not be negative");
    }
    return dims;
}

DesignObject parse_object(const json& j, size_t index, const std::string& spec_id) {
    const std::string where = "objects[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        throw Utils::InvalidSpec(spec_id, where + " must be an object");
    }

    DesignObject obj;
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        throw Utils::InvalidSpec(spec_id, where + ".id is required and must be a non-empty string");
    }
    obj.id = j["id"].get<std::string>();

    if (!j.contains("material") || !j["material"].is_string()) {
        throw Utils::InvalidSpec(spec_id, where + ".material is required and must be a string");
    }
    obj.material = j["material"].get<std::string>();

    obj.type = optional_string(j, "type", spec_id, where);
    if (obj.type.empty()) {
        obj.type = type_from_id(obj.id);
    }
    obj.color = optional_string(j, "color", spec_id, where);

    if (j.contains("dimensions") && !j["dimensions"].is_null()) {
        obj.dimensions = parse_dimensions(j["dimensions"], spec_id, where + ".dimensions");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_known(it.key(), OBJECT_KEYS)) {
            obj.attributes[it.key()] = it.value();
        }
    }
    return obj;
}

SceneMetadata parse_scene(const json& j, const std::string& spec_id) {
    if (!j.is_object()) {
        throw Utils::InvalidSpec(spec_id, "scene must be an object");
    }
    SceneMetadata scene;
    scene.style = optional_string(j, "style", spec_id, "scene");
    scene.estimated_cost = optional_number(j, "estimated_cost", spec_id, "scene");
    scene.city = optional_string(j, "city", spec_id, "scene");
    scene.budget = optional_number(j, "budget", spec_id, "scene");

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_known(it.key(), SCENE_KEYS)) {
            scene.attributes[it.key()] = it.value();
        }
    }
    return scene;
}

} // namespace

double Dimensions::footprint() const {
    double w = width > 0.0 ? width : 1.0;
    double d = depth > 0.0 ? depth : 1.0;
    return w * d;
}

bool DesignObject::operator==(const DesignObject& other) const {
    return id == other.id && type == other.type && material == other.material &&
           color == other.color && dimensions == other.dimensions && attributes == other.attributes;
}

bool SceneMetadata::operator==(const SceneMetadata& other) const {
    return style == other.style && estimated_cost == other.estimated_cost && city == other.city &&
           budget == other.budget && attributes == other.attributes;
}

std::string type_from_id(const std::string& id) {
    auto pos = id.find('_');
    if (pos == std::string::npos || pos == 0) {
        return id;
    }
    return id.substr(0, pos);
}

DesignSpecification DesignSpecification::from_json(const json& j, const std::string& spec_id) {
    if (!j.is_object()) {
        throw Utils::InvalidSpec(spec_id, "spec must be a JSON object");
    }
    if (!j.contains("objects") || !j["objects"].is_array()) {
        throw Utils::InvalidSpec(spec_id, "'objects' is required and must be an array");
    }

    DesignSpecification spec;
    const json& objects = j["objects"];
    spec.objects_.reserve(objects.size());
    for (size_t i = 0; i < objects.size(); ++i) {
        spec.objects_.push_back(parse_object(objects[i], i, spec_id));
    }

    if (j.contains("scene") && !j["scene"].is_null()) {
        spec.scene_ = parse_scene(j["scene"], spec_id);
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "objects" && it.key() != "scene") {
            spec.attributes_[it.key()] = it.value();
        }
    }

    spec.validate(spec_id);
    return spec;
}

DesignSpecification DesignSpecification::from_string(const std::string& text, const std::string& spec_id) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw Utils::InvalidSpec(spec_id, std::string("not valid JSON: ") + e.what());
    }
    return from_json(j, spec_id);
}

DesignSpecification DesignSpecification::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw Utils::InvalidSpec(path, "cannot open spec file");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str(), path);
}

void DesignSpecification::validate(const std::string& spec_id) const {
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < objects_.size(); ++i) {
        const auto& obj = objects_[i];
        const std::string where = "objects[" + std::to_string(i) + "]";
        if (obj.id.empty()) {
            throw Utils::InvalidSpec(spec_id, where + ".id must not be empty");
        }
        if (obj.type.empty()) {
            throw Utils::InvalidSpec(spec_id, where + ".type must not be empty");
        }
        if (!seen.insert(obj.id).second) {
            throw Utils::InvalidSpec(spec_id, "duplicate object id '" + obj.id + "'");
        }
        const Dimensions& d = obj.dimensions;
        if (!std::isfinite(d.width) || !std::isfinite(d.depth) || !std::isfinite(d.height) ||
            d.width < 0.0 || d.depth < 0.0 || d.height < 0.0) {
            throw Utils::InvalidSpec(spec_id, where + ".dimensions must be finite and non-negative");
        }
    }
    if (!std::isfinite(scene_.estimated_cost) || !std::isfinite(scene_.budget)) {
        throw Utils::InvalidSpec(spec_id, "scene numbers must be finite");
    }
}

json DesignSpecification::to_json() const {
    json objects = json::array();
    for (const auto& obj : objects_) {
        json o = obj.attributes.is_object() ? obj.attributes : json::object();
        o["id"] = obj.id;
        o["type"] = obj.type;
        o["material"] = obj.material;
        if (!obj.color.empty()) {
            o["color"] = obj.color;
        }
        if (obj.dimensions.is_specified()) {
            o["dimensions"] = {
                {"width", obj.dimensions.width},
                {"depth", obj.dimensions.depth},
                {"height", obj.dimensions.height}
            };
        }
        objects.push_back(std::move(o));
    }

    json scene = scene_.attributes.is_object() ? scene_.attributes : json::object();
    if (!scene_.style.empty()) scene["style"] = scene_.style;
    if (!scene_.city.empty()) scene["city"] = scene_.city;
    scene["estimated_cost"] = scene_.estimated_cost;
    if (scene_.budget > 0.0) scene["budget"] = scene_.budget;

    json j = attributes_.is_object() ? attributes_ : json::object();
    j["objects"] = std::move(objects);
    j["scene"] = std::move(scene);
    return j;
}

std::string DesignSpecification::dump(int indent) const {
    return to_json().dump(indent);
}

const DesignObject* DesignSpecification::find(const std::string& id) const {
    for (const auto& obj : objects_) {
        if (obj.id == id) {
            return &obj;
        }
    }
    return nullptr;
}

bool DesignSpecification::operator==(const DesignSpecification& other) const {
    return objects_ == other.objects_ && scene_ == other.scene_ && attributes_ == other.attributes_;
}

} // namespace Spec
} // namespace SpecOpt
