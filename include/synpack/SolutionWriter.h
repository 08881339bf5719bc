#pragma once
#include <string>
#include "synpack/Config.h"
#include "synpack/Solution.h"

namespace synpack {

// Solution as a JSON document (picojson serializer). `pretty` indents.
std::string WriteSolutionJson(const Config& cfg, const Solution& sol, bool pretty = true);

// One row per container: ID,Items,Weight,Capacity,Synergy,Value
bool WriteSolutionCsv(const Solution& sol, const std::string& filename, std::string* err);

} // namespace synpack
