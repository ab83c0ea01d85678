#include "skymodel/ChainContext.hpp"
#include "skymodel/Components.hpp"
#include "skymodel/Exceptions.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace skymodel {
namespace {

using K = ComponentKind;

bool applies_to(const std::vector<ComponentKind>& kinds, ComponentKind kind)
{
    return kinds.empty() || std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

/* freq_ref is stored upstream as a flat list of per-Stokes frequencies;
 * shape it after the amplitude's Stokes axis. */
void reshape_freq_ref(ChainArgs& args)
{
    auto fr = args.find("freq_ref");
    if (fr == args.end()) return;

    auto amp = args.find("amp");
    if (amp == args.end())
        throw TypeError("chain field 'amp' is required to shape 'freq_ref'");
    if (!fr->second.unit)
        throw TypeError("chain field 'freq_ref' has no unit");

    Quantity q = Quantity(fr->second.values, *fr->second.unit).to(units::GHz, spectral());
    const Index stokes = amp->second.values.rows();
    if (stokes == 1 && q.size() >= 1)
        q = Quantity(q.value()(0, 0), units::GHz);
    else if (stokes == 3 && q.size() == 3)
        q = q.reshaped(3, 1);
    else
        throw ShapeError("cannot reshape freq_ref of shape " + q.shape_str()
                         + " into shape (3, 1) or (1, 1)");

    fr->second = ChainField{q.value(), q.unit()};
}

// Only the intensity spectral index is used for point sources
void radio_first_row(ChainArgs& args)
{
    auto it = args.find("alpha");
    if (it == args.end() || it->second.values.rows() <= 1) return;
    it->second.values = Array2D(it->second.values.row(0));
}

/* Chains store most parameters as full maps; a map whose every Stokes row
 * is constant is collapsed to (S, 1). */
void map_to_scalar(ChainArgs& args)
{
    for (auto& [key, field] : args) {
        if (key == "amp" || key == "freq_ref") continue;
        Array2D& v = field.values;
        if (v.cols() <= 1) continue;

        bool uniform = true;
        for (Index r = 0; r < v.rows() && uniform; ++r)
            uniform = (v.row(r) == v(r, 0)).all();
        if (uniform)
            v = Array2D(v.col(0));
    }
}

} // unnamed namespace

std::string to_label(ComponentKind kind)
{
    switch (kind) {
        case K::Synchrotron: return "synch";
        case K::ThermalDust: return "dust";
        case K::FreeFree:    return "ff";
        case K::AME:         return "ame";
        case K::CMB:         return "cmb";
        case K::Radio:       return "radio";
    }
    throw std::invalid_argument("unknown component kind");
}

ComponentKind kind_from_label(const std::string& label)
{
    static const std::map<std::string, ComponentKind> kinds = {
        {"synch", K::Synchrotron}, {"dust", K::ThermalDust}, {"ff", K::FreeFree},
        {"ame", K::AME},           {"cmb", K::CMB},          {"radio", K::Radio},
    };
    auto it = kinds.find(label);
    if (it == kinds.end())
        throw std::invalid_argument("Unknown component label: " + label);
    return it->second;
}

const std::vector<NameMapping>& chain_name_mappings()
{
    static const std::vector<NameMapping> table = {
        {{},              "freq_ref",  "nu_ref"},
        {{K::Radio},      "alpha",     "specind"},
        {{K::AME},        "freq_peak", "nu_p"},
        {{K::FreeFree},   "T_e",       "Te"},
    };
    return table;
}

const std::vector<UnitAssignment>& chain_unit_assignments()
{
    static const std::vector<UnitAssignment> table = {
        {{},                                                     "freq_ref",  units::Hz},
        {{K::AME, K::ThermalDust, K::Synchrotron, K::FreeFree}, "amp",       units::uK_RJ},
        {{K::CMB},                                               "amp",       units::uK_CMB},
        {{K::Radio},                                             "amp",       units::mJy},
        {{K::AME},                                               "freq_peak", units::GHz},
        {{K::ThermalDust},                                       "T",         units::K},
        {{K::FreeFree},                                          "T_e",       units::K},
        {{K::Synchrotron, K::ThermalDust},                       "beta",      units::dimensionless},
        {{K::Radio},                                             "alpha",     units::dimensionless},
    };
    return table;
}

const std::vector<ContextRule>& chain_context_rules()
{
    static const std::vector<ContextRule> table = {
        {{},         "freq_ref",      reshape_freq_ref},
        {{K::Radio}, "first_row",     radio_first_row},
        {{},         "map_to_scalar", map_to_scalar},
    };
    return table;
}

ComponentArgs apply_chain_context(ComponentKind kind, ChainArgs args)
{
    for (const auto& m : chain_name_mappings()) {
        if (!applies_to(m.kinds, kind)) continue;
        auto it = args.find(m.upstream);
        if (it == args.end()) continue;
        ChainField field = std::move(it->second);
        args.erase(it);
        args[m.target] = std::move(field);
    }

    // Units describe how the chain stores a field; a unit already carried
    // by the field wins.
    for (const auto& u : chain_unit_assignments()) {
        if (!applies_to(u.kinds, kind)) continue;
        auto it = args.find(u.field);
        if (it != args.end() && !it->second.unit)
            it->second.unit = u.unit;
    }

    for (const auto& rule : chain_context_rules())
        if (applies_to(rule.kinds, kind)) rule.apply(args);

    ComponentArgs out;
    for (auto& [key, field] : args) {
        if (!field.unit)
            throw TypeError(to_label(kind) + ": chain field '" + key + "' has no unit");
        out.emplace(key, Quantity(std::move(field.values), *field.unit));
    }
    return out;
}

namespace {

const Quantity& require(const ComponentArgs& args, const std::string& key, ComponentKind kind)
{
    auto it = args.find(key);
    if (it == args.end())
        throw TypeError(to_label(kind) + ": missing required argument '" + key + "'");
    return it->second;
}

void reject_unexpected(const ComponentArgs& args, const std::set<std::string>& allowed,
                       ComponentKind kind)
{
    for (const auto& kv : args)
        if (!allowed.count(kv.first))
            throw TypeError(to_label(kind) + ": unexpected argument '" + kv.first + "'");
}

const std::string& require_path(const std::string& path, const char* what, ComponentKind kind)
{
    if (path.empty())
        throw std::invalid_argument(to_label(kind) + ": no " + what + " path configured");
    return path;
}

} // unnamed namespace

std::unique_ptr<Component>
make_component(ComponentKind kind, const ComponentArgs& args, const ComponentOptions& options)
{
    auto q = [&](const std::string& key) { return require(args, key, kind); };

    switch (kind) {
        case K::Synchrotron:
            reject_unexpected(args, {"amp", "freq_ref", "beta"}, kind);
            return std::make_unique<Synchrotron>(q("amp"), q("freq_ref"), q("beta"));
        case K::ThermalDust:
            reject_unexpected(args, {"amp", "freq_ref", "beta", "T"}, kind);
            return std::make_unique<ThermalDust>(q("amp"), q("freq_ref"), q("beta"), q("T"));
        case K::FreeFree:
            reject_unexpected(args, {"amp", "freq_ref", "T_e"}, kind);
            return std::make_unique<FreeFree>(q("amp"), q("freq_ref"), q("T_e"));
        case K::AME:
            reject_unexpected(args, {"amp", "freq_ref", "freq_peak"}, kind);
            return std::make_unique<AME>(q("amp"), q("freq_ref"), q("freq_peak"),
                                         require_path(options.spdust2_path, "spdust2 template", kind));
        case K::CMB:
            reject_unexpected(args, {"amp", "freq_ref"}, kind);
            return std::make_unique<CMB>(q("amp"), q("freq_ref"));
        case K::Radio:
            reject_unexpected(args, {"amp", "freq_ref", "alpha"}, kind);
            return std::make_unique<Radio>(q("amp"), q("freq_ref"), q("alpha"),
                                           require_path(options.radio_catalog_path, "radio catalog", kind));
    }
    throw std::invalid_argument("unknown component kind");
}

std::unique_ptr<Component>
make_component_from_chain(ComponentKind kind, ChainArgs args, const ComponentOptions& options)
{
    return make_component(kind, apply_chain_context(kind, std::move(args)), options);
}

} // namespace skymodel
