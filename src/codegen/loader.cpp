#include "codegen/loader.hpp"

#include "write_joined.hpp"

#include <boost/algorithm/string/replace.hpp>

#include <sstream>

namespace modsync::codegen
{
namespace
{

// clang-format off
constexpr std::string_view kLoaderTemplate = R"PS1(# {{module_name}}.psm1
# Generated by modsync from the files under {{public_dir}}. Do not edit by hand.

$privateFiles = @(Get-ChildItem -Path (Join-Path $PSScriptRoot '{{private_dir}}') -Filter '*{{extension}}' -File -Recurse -ErrorAction SilentlyContinue)
$publicFiles = @(Get-ChildItem -Path (Join-Path $PSScriptRoot '{{public_dir}}') -Filter '*{{extension}}' -File -Recurse -ErrorAction SilentlyContinue)

foreach ($file in @($privateFiles + $publicFiles)) {
    try {
        . $file.FullName
    } catch {
        Write-Error "Failed to load $($file.FullName): $_"
    }
}

$FunctionsToExport = {{functions}}

$AliasesToExport = {{aliases}}

Export-ModuleMember -Function $FunctionsToExport -Alias $AliasesToExport
)PS1";
// clang-format on

std::string escape_single_quoted(std::string_view text)
{
    return boost::algorithm::replace_all_copy(std::string(text), "'", "''");
}

}  // namespace

std::string_view default_loader_template()
{
    return kLoaderTemplate;
}

std::string quote(std::string_view name)
{
    return "'" + escape_single_quoted(name) + "'";
}

std::string render_array(const std::vector<std::string>& names)
{
    if (names.empty()) {
        return "@()";
    }

    std::ostringstream out;
    out << "@(\n";
    write_joined(
        out, names,
        [](const std::string& name) {
            return indentation(1) + quote(name);
        },
        "\n");
    out << "\n)";
    return out.str();
}

Template::Bindings loader_bindings(const frontend::ModuleDescriptor& module, const ExportManifest& manifest,
                                   const GenerationOptions& options)
{
    Template::Bindings bindings;
    bindings.emplace("module_name", module.name);
    bindings.emplace("public_dir", escape_single_quoted(options.layout.public_dir));
    bindings.emplace("private_dir", escape_single_quoted(options.layout.private_dir));
    bindings.emplace("extension", escape_single_quoted(options.scan.extension));
    bindings.emplace("functions", render_array(manifest.functions));
    bindings.emplace("aliases", render_array(manifest.aliases));
    return bindings;
}

std::expected<std::string, std::string> render_loader(const Template& skeleton,
                                                      const frontend::ModuleDescriptor& module,
                                                      const ExportManifest& manifest,
                                                      const GenerationOptions& options)
{
    return skeleton.render(loader_bindings(module, manifest, options));
}

}  // namespace modsync::codegen
