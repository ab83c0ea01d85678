#pragma once
#include "Component.hpp"
#include "Quantity.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skymodel {

enum class ComponentKind { Synchrotron, ThermalDust, FreeFree, AME, CMB, Radio };

std::string   to_label(ComponentKind kind);              // "synch", "dust", ...
ComponentKind kind_from_label(const std::string& label); // throws std::invalid_argument

// A field as stored upstream: values, unit only if the source carried one
struct ChainField {
    Array2D             values;
    std::optional<Unit> unit;
};

using ChainArgs     = std::map<std::string, ChainField>;
using ComponentArgs = std::map<std::string, Quantity>;

/* Ordered adaptation rules.  A rule with an empty `kinds` list applies to
 * every component family. */
struct NameMapping {
    std::vector<ComponentKind> kinds;
    std::string                target;     // constructor keyword
    std::string                upstream;   // name in the chain
};

struct UnitAssignment {
    std::vector<ComponentKind> kinds;
    std::string                field;
    Unit                       unit;
};

struct ContextRule {
    std::vector<ComponentKind>       kinds;
    std::string                      name;
    std::function<void(ChainArgs&)>  apply;
};

const std::vector<NameMapping>&    chain_name_mappings();
const std::vector<UnitAssignment>& chain_unit_assignments();
const std::vector<ContextRule>&    chain_context_rules();

/* Rename, attach units, reshape freq_ref and collapse uniform maps so the
 * result holds exactly the keywords the component constructor takes.
 * Throws TypeError for fields without a unit or a missing amplitude and
 * ShapeError if freq_ref cannot be shaped after the amplitude.            */
ComponentArgs apply_chain_context(ComponentKind kind, ChainArgs args);

struct ComponentOptions {
    std::string spdust2_path;
    std::string radio_catalog_path;
};

// Construct by keyword; TypeError on missing or unexpected keywords
std::unique_ptr<Component>
make_component(ComponentKind kind, const ComponentArgs& args,
               const ComponentOptions& options = {});

// apply_chain_context() followed by make_component()
std::unique_ptr<Component>
make_component_from_chain(ComponentKind kind, ChainArgs args,
                          const ComponentOptions& options = {});

} // namespace skymodel
