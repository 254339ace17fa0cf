#include "codegen/json_dump.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace modsync::codegen
{
namespace
{

nlohmann::json to_json(const ArtifactReport& report)
{
    nlohmann::json out;
    out["path"] = report.path.string();
    out["status"] = std::string(to_string(report.status));
    return out;
}

}  // namespace

nlohmann::json to_json(const ExportManifest& manifest)
{
    nlohmann::json out;
    out["functions"] = manifest.functions;
    out["aliases"] = manifest.aliases;
    return out;
}

nlohmann::json to_json(const RegenerationResult& result)
{
    nlohmann::json out = to_json(result.manifest);
    out["name"] = result.module_name;
    out["work_in_progress"] = result.work_in_progress;
    out["files"] = {
        {"scanned", result.files_scanned},
        {"excluded", result.files_excluded},
        {"unreadable", result.files_unreadable},
        {"updated", result.files_updated},
    };
    out["loader"] = to_json(result.loader);
    out["manifest"] = to_json(result.manifest_file);
    if (result.version) {
        out["version"] = {
            {"previous", result.version->previous},
            {"current", result.version->current},
            {"status", std::string(to_string(result.version->status))},
        };
    }
    return out;
}

}  // namespace modsync::codegen
