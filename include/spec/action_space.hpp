#pragma once

#include "spec/design_spec.hpp"
#include "spec/material_catalog.hpp"
#include <string>
#include <vector>

namespace SpecOpt {
namespace Spec {

enum class ActionKind {
    NoOp,
    SetMaterial,
    Resize,
    AddObject,
    RemoveObject
};

std::string action_kind_name(ActionKind kind);

// One edit; only the fields relevant to the kind are meaningful
struct Action {
    ActionKind kind = ActionKind::NoOp;
    int slot = -1;              // object position for SetMaterial/Resize/RemoveObject
    std::string material;       // SetMaterial
    double scale = 1.0;         // Resize
    std::string object_type;    // AddObject
};

struct ActionSpaceConfig {
    int max_objects = 8;
    std::vector<std::string> material_palette = {
        "marble_white", "wood_oak", "leather_brown", "fabric_orange",
        "fabric_linen", "tile_porcelain", "steel_brushed", "glass_tempered"
    };
    std::vector<double> resize_factors = {0.9, 1.1};
    std::vector<std::string> addable_types = {"sofa", "table", "lamp", "plant"};
};

// Result of decoding an index against a spec
struct MutatedSpec {
    DesignSpecification spec;
    Action action;
    bool applied = false;       // spec differs from the input
    bool degraded = false;      // index or slot was invalid and became NoOp
};

/**
 * Fixed discrete action space over spec edits.
 *
 * Layout:
 *   [0]                                         NoOp
 *   [1, 1 + M*P)                                SetMaterial(slot, palette[p])
 *   [.., + M*R)                                 Resize(slot, factors[r])
 *   [.., + T)                                   AddObject(types[t])
 *   [.., + M)                                   RemoveObject(slot)
 *
 * The size depends only on the configuration, never on the spec.
 */
class ActionSpace {
public:
    explicit ActionSpace(ActionSpaceConfig config = ActionSpaceConfig(),
                         const MaterialCatalog& catalog = MaterialCatalog::builtin());

    int size() const { return size_; }
    const ActionSpaceConfig& config() const { return config_; }

    // Static meaning of an index, independent of any spec.
    // Indices outside [0, size) map to NoOp.
    Action action_at(int index) const;

    /**
     * Apply the action with the given index to a copy of spec.
     * Never throws: out-of-range indices and slots beyond the current object
     * count degrade to NoOp. Applied edits recompute scene.estimated_cost.
     */
    MutatedSpec decode(int index, const DesignSpecification& spec) const;

    MutatedSpec apply(const Action& action, const DesignSpecification& spec) const;

    std::string describe(const Action& action) const;
    std::string describe(int index) const { return describe(action_at(index)); }

private:
    ActionSpaceConfig config_;
    const MaterialCatalog& catalog_;
    int material_offset_;
    int resize_offset_;
    int add_offset_;
    int remove_offset_;
    int size_;

    std::string next_free_id(const DesignSpecification& spec, const std::string& type) const;
};

} // namespace Spec
} // namespace SpecOpt
