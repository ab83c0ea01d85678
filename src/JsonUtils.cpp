#include "skymodel/JsonUtils.hpp"
#include "skymodel/Exceptions.hpp"
#include "skymodel/HealpixIO.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>

namespace skymodel {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "'");
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Error parsing JSON from " + path + ": " + e.what());
    }
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

Array2D array_from_json(const nlohmann::json& j)
{
    if (j.is_number())
        return Array2D::Constant(1, 1, j.get<double>());

    if (!j.is_array() || j.empty())
        throw TypeError("expected a number or a non-empty array, got " + j.dump());

    if (!j.front().is_array()) {
        const auto v = j.get<std::vector<double>>();
        Array2D out(1, static_cast<Index>(v.size()));
        for (std::size_t k = 0; k < v.size(); ++k) out(0, static_cast<Index>(k)) = v[k];
        return out;
    }

    const auto rows = j.get<std::vector<std::vector<double>>>();
    const std::size_t ncols = rows.front().size();
    Array2D out(static_cast<Index>(rows.size()), static_cast<Index>(ncols));
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != ncols)
            throw ShapeError("ragged array in JSON: row " + std::to_string(r) + " has "
                             + std::to_string(rows[r].size()) + " entries, expected "
                             + std::to_string(ncols));
        for (std::size_t c = 0; c < ncols; ++c)
            out(static_cast<Index>(r), static_cast<Index>(c)) = rows[r][c];
    }
    return out;
}

Quantity quantity_from_json(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("value"))
        throw TypeError("quantity must be an object with a \"value\" key: " + j.dump());
    const Unit unit = j.contains("unit") ? Unit::parse(j["unit"].get<std::string>())
                                         : units::dimensionless;
    return Quantity(array_from_json(j["value"]), unit);
}

ChainField chain_field_from_json(const nlohmann::json& j)
{
    ChainField field;
    if (j.is_number() || j.is_array()) {
        field.values = array_from_json(j);
        return field;
    }
    if (!j.is_object())
        throw TypeError("cannot interpret chain field " + j.dump());

    if (j.contains("fits"))
        field.values = read_healpix_map(j["fits"].get<std::string>(),
                                        j.value("fields", 0));
    else if (j.contains("value"))
        field.values = array_from_json(j["value"]);
    else
        throw TypeError("chain field needs \"value\" or \"fits\": " + j.dump());

    if (j.contains("unit"))
        field.unit = Unit::parse(j["unit"].get<std::string>());
    return field;
}

ChainArgs chain_args_from_json(const nlohmann::json& component)
{
    ChainArgs args;
    for (const auto& [key, val] : component.items()) {
        if (key == "kind") continue;
        args[key] = chain_field_from_json(val);
    }
    return args;
}

} // namespace skymodel
