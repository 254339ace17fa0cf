#pragma once

#include "codegen/export_manifest.hpp"
#include "codegen/options.hpp"
#include "codegen/template.hpp"
#include "frontend/module.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace modsync::codegen
{

/**
 * @brief The built-in loader script skeleton.
 *
 * Dot-sources every private file, then every public file (work-in-progress files included),
 * and exports the curated function and alias lists.
 */
std::string_view default_loader_template();

/// `name` as a single-quoted PowerShell string literal.
std::string quote(std::string_view name);

/// Names as a multi-line PowerShell array literal, `@()` when empty.
std::string render_array(const std::vector<std::string>& names);

Template::Bindings loader_bindings(const frontend::ModuleDescriptor& module, const ExportManifest& manifest,
                                   const GenerationOptions& options);

/**
 * @brief Render the loader script of a module.
 *
 * @param skeleton Loader skeleton, see default_loader_template().
 * @param module Module being regenerated.
 * @param manifest Names to export.
 * @param options Layout and extension used by the skeleton.
 * @return Rendered script or error message.
 */
std::expected<std::string, std::string> render_loader(const Template& skeleton,
                                                      const frontend::ModuleDescriptor& module,
                                                      const ExportManifest& manifest,
                                                      const GenerationOptions& options);

}  // namespace modsync::codegen
