#include "codegen/regenerate.hpp"

#include "codegen/generator.hpp"
#include "frontend/frontend.hpp"
#include "frontend/semantic/validator.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace modsync::codegen
{

bool RegenerationResult::has_stale_artifacts() const
{
    return loader.status == ArtifactStatus::Stale || manifest_file.status == ArtifactStatus::Stale ||
           (version && version->status == ArtifactStatus::Stale);
}

std::expected<RegenerationResult, std::string> regenerate(const frontend::ModuleDescriptor& module,
                                                          const GenerationOptions& options,
                                                          frontend::DiagnosticSink& diagnostics)
{
    // Scan
    auto sources = frontend::scan_module(module, options.scan, diagnostics);
    if (!sources) {
        return std::unexpected(sources.error());
    }

    // Validate
    frontend::semantic::Validator validator{sources.value(), diagnostics};
    validator.run();

    RegenerationResult result;
    result.module_name = module.name;
    result.files_scanned = sources->files_discovered;
    result.files_excluded = sources->files_work_in_progress();
    result.files_unreadable = sources->files_unreadable;
    result.manifest = build_export_manifest(sources.value());
    for (const auto& record : sources->functions) {
        if (record.work_in_progress) {
            result.work_in_progress.push_back(record.name);
        }
    }

    spdlog::debug("{}: {} function(s), {} alias(es) to export", module.name, result.manifest.functions.size(),
                  result.manifest.aliases.size());

    // Generate
    Generator generator{module, result.manifest, options};
    auto report = generator.run(diagnostics);
    if (!report) {
        return std::unexpected(report.error());
    }
    result.loader = std::move(report->loader);
    result.manifest_file = std::move(report->manifest);

    if (options.bump) {
        auto bump = bump_module_version(module.manifest_path(), *options.bump, options.write);
        if (!bump) {
            return std::unexpected("Version bump failed: " + bump.error());
        }
        result.version = std::move(bump.value());
    }

    for (auto status : {result.loader.status, result.manifest_file.status}) {
        if (status == ArtifactStatus::Updated) {
            ++result.files_updated;
        }
    }
    // a bump rewrites the manifest; count it once
    if (result.version && result.version->status == ArtifactStatus::Updated &&
        result.manifest_file.status != ArtifactStatus::Updated) {
        ++result.files_updated;
    }

    return result;
}

}  // namespace modsync::codegen
