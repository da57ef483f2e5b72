#pragma once

#include "spec/design_spec.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SpecOpt {
namespace Spec {

struct MaterialInfo {
    std::string name;
    std::string family;     // wood, stone, tile, fabric, leather, metal, glass, paint, polymer, generic
    int tier;               // 0 = generic/basic, higher = better finish
    double unit_cost;       // per square metre of footprint
};

struct ObjectTypeDefaults {
    std::string material;           // what a freshly added object is made of
    std::string premium_material;   // upgrade target when the material is generic
    std::string color;
    Dimensions dimensions;
};

/**
 * Static catalog of materials and object types.
 * Drives the add-object defaults, cost estimation and the heuristic upgrades.
 */
class MaterialCatalog {
public:
    // Built-in table
    static const MaterialCatalog& builtin();

    MaterialCatalog(std::vector<MaterialInfo> materials,
                    std::map<std::string, ObjectTypeDefaults> type_defaults);

    std::optional<MaterialInfo> lookup(const std::string& material) const;

    // Unknown materials are priced as "default"
    double unit_cost(const std::string& material) const;

    /**
     * Next-better material: the lowest-tier material of the same family above
     * the current tier. For generic or unknown materials the object type's
     * premium material. Empty when nothing better is known.
     */
    std::string upgrade_for(const std::string& material, const std::string& object_type) const;

    // Every better material: higher tiers of the family in ascending order, then the type's premium material
    std::vector<std::string> upgrade_options(const std::string& material, const std::string& object_type) const;

    ObjectTypeDefaults defaults_for(const std::string& object_type) const;

    // Sum of unit cost x footprint over all objects
    double estimate_cost(const DesignSpecification& spec) const;

    const std::vector<MaterialInfo>& materials() const { return materials_; }

private:
    std::vector<MaterialInfo> materials_;
    std::map<std::string, size_t> index_;
    std::map<std::string, ObjectTypeDefaults> type_defaults_;
};

} // namespace Spec
} // namespace SpecOpt
