#include "spec/material_catalog.hpp"

#include <algorithm>

namespace SpecOpt {
namespace Spec {

namespace {

std::vector<MaterialInfo> builtin_materials() {
    return {
        {"default", "generic", 0, 10.0},
        {"wood", "wood", 0, 20.0},
        {"wood_basic", "wood", 0, 20.0},
        {"laminate", "wood", 0, 15.0},
        {"wood_oak", "wood", 1, 45.0},
        {"wood_walnut", "wood", 2, 70.0},
        {"concrete", "stone", 0, 15.0},
        {"granite", "stone", 1, 90.0},
        {"marble_white", "stone", 2, 120.0},
        {"tile_basic", "tile", 0, 18.0},
        {"tile_porcelain", "tile", 1, 35.0},
        {"fabric_basic", "fabric", 0, 12.0},
        {"fabric_linen", "fabric", 1, 28.0},
        {"fabric_orange", "fabric", 1, 25.0},
        {"fabric_velvet", "fabric", 2, 45.0},
        {"leather_basic", "leather", 0, 40.0},
        {"leather_brown", "leather", 1, 80.0},
        {"steel", "metal", 0, 30.0},
        {"aluminum", "metal", 1, 45.0},
        {"steel_brushed", "metal", 1, 50.0},
        {"plastic", "polymer", 0, 8.0},
        {"glass_basic", "glass", 0, 25.0},
        {"glass_tempered", "glass", 1, 40.0},
        {"paint_basic", "paint", 0, 5.0},
        {"paint_matte", "paint", 1, 9.0},
    };
}

std::map<std::string, ObjectTypeDefaults> builtin_type_defaults() {
    return {
        {"floor", {"wood_basic", "wood_oak", "natural", {4.0, 4.0, 0.02}}},
        {"wall", {"paint_basic", "paint_matte", "white", {4.0, 0.15, 2.7}}},
        {"ceiling", {"paint_basic", "paint_matte", "white", {4.0, 4.0, 0.02}}},
        {"sofa", {"fabric_basic", "fabric_linen", "grey", {2.1, 0.9, 0.85}}},
        {"cushion", {"fabric_basic", "fabric_orange", "orange", {0.45, 0.45, 0.15}}},
        {"table", {"wood_basic", "wood_oak", "natural", {1.2, 0.7, 0.75}}},
        {"chair", {"wood_basic", "wood_oak", "natural", {0.5, 0.5, 0.9}}},
        {"countertop", {"laminate", "marble_white", "white", {2.4, 0.6, 0.04}}},
        {"cabinet", {"laminate", "wood_oak", "white", {0.8, 0.6, 0.9}}},
        {"lamp", {"steel", "steel_brushed", "black", {0.4, 0.4, 1.6}}},
        {"window", {"glass_basic", "glass_tempered", "clear", {1.2, 0.1, 1.4}}},
        {"plant", {"plastic", "", "green", {0.4, 0.4, 1.0}}},
        {"rug", {"fabric_basic", "fabric_velvet", "beige", {2.0, 1.4, 0.01}}},
    };
}

} // namespace

const MaterialCatalog& MaterialCatalog::builtin() {
    static const MaterialCatalog catalog(builtin_materials(), builtin_type_defaults());
    return catalog;
}

MaterialCatalog::MaterialCatalog(std::vector<MaterialInfo> materials,
                                 std::map<std::string, ObjectTypeDefaults> type_defaults)
    : materials_(std::move(materials)), type_defaults_(std::move(type_defaults)) {
    for (size_t i = 0; i < materials_.size(); ++i) {
        index_[materials_[i].name] = i;
    }
}

std::optional<MaterialInfo> MaterialCatalog::lookup(const std::string& material) const {
    auto it = index_.find(material);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return materials_[it->second];
}

double MaterialCatalog::unit_cost(const std::string& material) const {
    auto info = lookup(material);
    if (info) {
        return info->unit_cost;
    }
    auto fallback = lookup("default");
    return fallback ? fallback->unit_cost : 10.0;
}

std::string MaterialCatalog::upgrade_for(const std::string& material, const std::string& object_type) const {
    auto info = lookup(material);

    if (!info || info->family == "generic") {
        return defaults_for(object_type).premium_material;
    }

    // Materials are listed in ascending tier order within a family; pick the
    // first one strictly above the current tier
    const MaterialInfo* best = nullptr;
    for (const auto& candidate : materials_) {
        if (candidate.family != info->family || candidate.tier <= info->tier) {
            continue;
        }
        if (!best || candidate.tier < best->tier) {
            best = &candidate;
        }
    }
    return best ? best->name : std::string();
}

std::vector<std::string> MaterialCatalog::upgrade_options(const std::string& material,
                                                          const std::string& object_type) const {
    std::vector<std::string> options;
    auto info = lookup(material);

    if (info && info->family != "generic") {
        std::vector<const MaterialInfo*> better;
        for (const auto& candidate : materials_) {
            if (candidate.family == info->family && candidate.tier > info->tier) {
                better.push_back(&candidate);
            }
        }
        std::stable_sort(better.begin(), better.end(),
                         [](const MaterialInfo* a, const MaterialInfo* b) { return a->tier < b->tier; });
        for (const auto* candidate : better) {
            options.push_back(candidate->name);
        }
    }

    const std::string premium = defaults_for(object_type).premium_material;
    auto premium_info = lookup(premium);
    bool downgrade = info && info->family != "generic" && premium_info && premium_info->tier <= info->tier;
    if (!premium.empty() && premium != material && !downgrade &&
        std::find(options.begin(), options.end(), premium) == options.end()) {
        options.push_back(premium);
    }
    return options;
}

ObjectTypeDefaults MaterialCatalog::defaults_for(const std::string& object_type) const {
    auto it = type_defaults_.find(object_type);
    if (it != type_defaults_.end()) {
        return it->second;
    }
    return ObjectTypeDefaults{"default", "", "", {1.0, 1.0, 1.0}};
}

double MaterialCatalog::estimate_cost(const DesignSpecification& spec) const {
    double total = 0.0;
    for (const auto& obj : spec.objects()) {
        total += unit_cost(obj.material) * obj.dimensions.footprint();
    }
    return total;
}

} // namespace Spec
} // namespace SpecOpt
