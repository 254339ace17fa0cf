#pragma once

#include "codegen/regenerate.hpp"

#include <nlohmann/json_fwd.hpp>

namespace modsync::codegen
{

nlohmann::json to_json(const ExportManifest& manifest);
nlohmann::json to_json(const RegenerationResult& result);

}  // namespace modsync::codegen
