#pragma once

#include "codegen/export_manifest.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace modsync::codegen
{

inline constexpr std::string_view kFunctionsField = "FunctionsToExport";
inline constexpr std::string_view kAliasesField = "AliasesToExport";

/// `<field> = @('a', 'b')`, or `<field> = @()` when empty.
std::string render_field(std::string_view field, const std::vector<std::string>& values);

struct FieldProblem {
    std::string field;
    std::string message;
};

struct PatchResult {
    std::string text;                   ///< manifest with every located field replaced
    std::vector<std::string> replaced;  ///< fields that were located and replaced
    std::vector<FieldProblem> missing;  ///< fields that were absent or malformed, left untouched
};

/**
 * @brief Replace the export fields of a declarative manifest.
 *
 * Only the `FunctionsToExport` and `AliasesToExport` assignments change; every other byte of
 * the manifest is kept. A field that cannot be located is reported and skipped, the other
 * one is still replaced.
 *
 * @param text Existing manifest content.
 * @param manifest Names to export.
 * @return Patched text and what happened to each field.
 */
PatchResult patch_manifest(const std::string& text, const ExportManifest& manifest);

}  // namespace modsync::codegen
