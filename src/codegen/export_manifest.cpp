#include "codegen/export_manifest.hpp"

#include <algorithm>

namespace modsync::codegen
{
namespace
{

void sort_unique(std::vector<std::string>& names)
{
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
}

}  // namespace

ExportManifest build_export_manifest(const frontend::ModuleSources& sources)
{
    ExportManifest manifest;
    for (const auto& record : sources.functions) {
        if (record.work_in_progress) {
            continue;
        }
        manifest.functions.push_back(record.name);
        manifest.aliases.insert(manifest.aliases.end(), record.aliases.begin(), record.aliases.end());
    }

    sort_unique(manifest.functions);
    sort_unique(manifest.aliases);
    return manifest;
}

}  // namespace modsync::codegen
