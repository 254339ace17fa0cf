#pragma once

#include "codegen/artifact.hpp"
#include "codegen/version.hpp"
#include "frontend/module.hpp"

#include <filesystem>
#include <optional>

namespace modsync::codegen
{

/**
 * @brief Everything a regeneration run needs to know besides the module itself.
 */
struct GenerationOptions {
    frontend::ModuleLayout layout;
    frontend::ScanOptions scan;
    std::optional<std::filesystem::path> loader_template;  ///< if not specified, use the built-in skeleton
    std::optional<BumpLevel> bump;                          ///< if specified, bump ModuleVersion afterwards
    WriteOptions write;
};

}  // namespace modsync::codegen
