#pragma once

#include "frontend/module.hpp"

#include <string>
#include <vector>

namespace modsync::codegen
{

/**
 * @brief Names a module exports.
 *
 * Both lists are sorted byte-wise and free of duplicates, so rendering them is deterministic.
 */
struct ExportManifest {
    std::vector<std::string> functions;
    std::vector<std::string> aliases;

    bool operator==(const ExportManifest&) const = default;
};

/**
 * @brief Derive the export manifest from scanned sources.
 *
 * Work-in-progress functions contribute neither their name nor their aliases.
 */
ExportManifest build_export_manifest(const frontend::ModuleSources& sources);

}  // namespace modsync::codegen
