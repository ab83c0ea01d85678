#pragma once
#include "ChainContext.hpp"
#include "Quantity.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace skymodel {
nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

// 3.0 -> (1,1), [a, b] -> (1,2), [[a], [b], [c]] -> (3,1)
Array2D array_from_json(const nlohmann::json& j);

// {"value": ..., "unit": "GHz"}; missing unit means dimensionless
Quantity quantity_from_json(const nlohmann::json& j);

// {"value": ...} or {"fits": "map.fits"}, optional "unit"
ChainField chain_field_from_json(const nlohmann::json& j);

// Every key of a component entry except "kind"
ChainArgs chain_args_from_json(const nlohmann::json& component);
} // namespace skymodel
