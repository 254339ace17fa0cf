#pragma once

#include "codegen/artifact.hpp"
#include "codegen/export_manifest.hpp"
#include "codegen/options.hpp"
#include "codegen/version.hpp"
#include "frontend/diagnostic.hpp"
#include "frontend/module.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace modsync::codegen
{

struct RegenerationResult {
    std::string module_name;
    std::size_t files_scanned = 0;     ///< candidate files found under the public directory
    std::size_t files_excluded = 0;    ///< work-in-progress files, scanned but not exported
    std::size_t files_unreadable = 0;  ///< skipped with a warning
    std::size_t files_updated = 0;     ///< generated files written by this run
    ExportManifest manifest;
    std::vector<std::string> work_in_progress;  ///< names of the excluded functions
    ArtifactReport loader;
    ArtifactReport manifest_file;
    std::optional<VersionBump> version;  ///< set when a bump was requested

    bool has_stale_artifacts() const;
};

/**
 * @brief Bring the loader script and the manifest of a module in line with its public functions.
 *
 * Scans the public directory, validates what it found, renders both artifacts and writes the
 * ones whose normalized content changed. Running it twice without source changes reports
 * both artifacts as unchanged the second time.
 *
 * @param module Module to regenerate.
 * @param options Layout, scan, template, write and version bump options.
 * @param diagnostics Sink for file-level warnings and notes.
 * @return Counters and per-artifact status, or an error if the module could not be regenerated.
 */
std::expected<RegenerationResult, std::string> regenerate(const frontend::ModuleDescriptor& module,
                                                          const GenerationOptions& options,
                                                          frontend::DiagnosticSink& diagnostics);

}  // namespace modsync::codegen
