#include "codegen/generator.hpp"

#include "codegen/file_writer.hpp"
#include "codegen/loader.hpp"
#include "codegen/manifest_patcher.hpp"
#include "frontend/frontend.hpp"

#include <filesystem>
#include <utility>

namespace modsync::codegen
{

Generator::Generator(const frontend::ModuleDescriptor& module, const ExportManifest& manifest,
                     GenerationOptions options)
    : _module(module)
    , _manifest(manifest)
    , _options(std::move(options))
{
}

std::expected<GenerationReport, std::string> Generator::run(frontend::DiagnosticSink& diagnostics)
{
    auto loader = emit_loader();
    if (!loader) {
        return std::unexpected(loader.error());
    }

    auto manifest = emit_manifest(diagnostics);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    return GenerationReport{std::move(loader.value()), std::move(manifest.value())};
}

std::expected<ArtifactReport, std::string> Generator::emit_loader() const
{
    std::string skeleton{default_loader_template()};
    if (_options.loader_template) {
        auto custom = frontend::detail::read_file(*_options.loader_template);
        if (!custom) {
            return std::unexpected("Failed to load loader template: " + custom.error());
        }
        skeleton = std::move(custom.value());
    }

    ArtifactReport report;
    report.path = _module.loader_path();

    const Template loader_template{std::move(skeleton)};
    auto status = write_file_if_changed(report.path, render_loader(loader_template, _module, _manifest, _options),
                                        _options.write);
    if (!status) {
        return std::unexpected(report.path.string() + ": " + status.error());
    }
    report.status = status.value();
    return report;
}

std::expected<ArtifactReport, std::string> Generator::emit_manifest(frontend::DiagnosticSink& diagnostics) const
{
    ArtifactReport report;
    report.path = _module.manifest_path();

    std::error_code ec;
    if (!std::filesystem::exists(report.path, ec)) {
        diagnostics.warning({report.path.string()}, "Manifest not found; export fields not updated");
        return report;
    }

    auto existing = frontend::detail::read_file(report.path);
    if (!existing) {
        diagnostics.warning({report.path.string()}, "Manifest unreadable; export fields not updated: " +
                                                        existing.error());
        return report;
    }

    auto patched = patch_manifest(existing.value(), _manifest);
    for (const auto& problem : patched.missing) {
        diagnostics.warning({report.path.string()}, problem.message + "; " + problem.field + " not updated");
    }
    if (patched.replaced.empty()) {
        return report;
    }

    // the manifest keeps its own line endings
    WriteOptions write_options = _options.write;
    write_options.crlf = false;
    auto status = write_file_if_changed(report.path, std::move(patched.text), write_options);
    if (!status) {
        return std::unexpected(report.path.string() + ": " + status.error());
    }
    report.status = status.value();
    return report;
}

}  // namespace modsync::codegen
