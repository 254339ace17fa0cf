#pragma once

#include "codegen/artifact.hpp"
#include "codegen/export_manifest.hpp"
#include "codegen/options.hpp"
#include "frontend/diagnostic.hpp"
#include "frontend/module.hpp"

#include <expected>
#include <string>

namespace modsync::codegen
{

struct GenerationReport {
    ArtifactReport loader;
    ArtifactReport manifest;
};

/**
 * @brief Renders and writes the two generated files of a module.
 *
 * The loader script is regenerated independently of the manifest: a missing manifest,
 * or a manifest without export fields, is a warning and leaves the loader untouched by it.
 */
class Generator
{
public:
    Generator(const frontend::ModuleDescriptor& module, const ExportManifest& manifest, GenerationOptions options);

    std::expected<GenerationReport, std::string> run(frontend::DiagnosticSink& diagnostics);

private:
    std::expected<ArtifactReport, std::string> emit_loader() const;
    std::expected<ArtifactReport, std::string> emit_manifest(frontend::DiagnosticSink& diagnostics) const;

    const frontend::ModuleDescriptor& _module;
    const ExportManifest& _manifest;
    GenerationOptions _options;
};

}  // namespace modsync::codegen
