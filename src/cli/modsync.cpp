#include "cli/modsync.hpp"

#include "cli/options.hpp"
#include "codegen/json_dump.hpp"
#include "codegen/regenerate.hpp"
#include "frontend/diagnostic.hpp"
#include "frontend/frontend.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <vector>

namespace modsync
{

namespace
{

void log_diagnostics(const std::string& module_name, const frontend::DiagnosticSink& diagnostics)
{
    const bool has_any_diagnostics = !diagnostics.diagnostics().empty();

    if (diagnostics.has_warnings()) {
        spdlog::warn("{}: regeneration warnings:", module_name);
    } else if (has_any_diagnostics) {
        spdlog::info("{}: regeneration diagnostics:", module_name);
    }

    for (const auto& diagnostic : diagnostics.diagnostics()) {
        auto log_message = fmt::format("{}: {}", frontend::to_string(diagnostic.location), diagnostic.message);
        switch (diagnostic.severity) {
            case frontend::Severity::Warning:
                spdlog::warn("{}", log_message);
                break;
            case frontend::Severity::Note:
                spdlog::info("{}", log_message);
                break;
        }
    }
}

void log_result(const codegen::RegenerationResult& result)
{
    for (const auto* report : {&result.loader, &result.manifest_file}) {
        if (report->status == codegen::ArtifactStatus::Stale) {
            spdlog::warn("{}: {}", report->path.string(), codegen::to_string(report->status));
        } else {
            spdlog::info("{}: {}", report->path.string(), codegen::to_string(report->status));
        }
    }

    if (result.version) {
        spdlog::info("{}: ModuleVersion {} -> {} ({})", result.module_name, result.version->previous,
                     result.version->current, codegen::to_string(result.version->status));
    }

    spdlog::info("{}: {} file(s) scanned, {} excluded, {} unreadable, {} function(s) and {} alias(es) exported, "
                 "{} file(s) updated",
                 result.module_name, result.files_scanned, result.files_excluded, result.files_unreadable,
                 result.manifest.functions.size(), result.manifest.aliases.size(), result.files_updated);
}

}  // namespace

int run(int argc, char* argv[])
{
    auto opts = parse_command_line(argc, argv);
    if (!opts) {
        spdlog::error("Failed to parse command line: {}", opts.error());
        return 1;
    }

    if (opts->help_message) {
        fmt::print("{}", opts->help_message.value());
        return 0;
    }

    auto generation = make_generation_options(opts.value());
    if (!generation) {
        spdlog::error("Failed to parse command line: {}", generation.error());
        return 1;
    }

    spdlog::set_level(opts->verbose ? spdlog::level::debug : spdlog::level::info);

    fmt::print("modsync v{}.{}.{}\n", MODSYNC_VERSION_MAJOR, MODSYNC_VERSION_MINOR, MODSYNC_VERSION_PATCH);

    namespace fs = std::filesystem;
    const fs::path base(opts->root);

    std::vector<std::string> module_names = opts->modules;
    if (opts->all) {
        auto discovered = frontend::discover_modules(base, generation->layout);
        if (!discovered) {
            spdlog::error("Failed to discover modules: {}", discovered.error());
            return 1;
        }
        if (discovered->empty()) {
            spdlog::warn("No modules found under {}", fs::absolute(base).string());
        }
        module_names = std::move(discovered.value());
    }

    int exit_code = 0;
    std::size_t updated = 0;
    std::size_t unchanged = 0;
    std::size_t failed = 0;
    std::size_t stale = 0;
    nlohmann::json modules_json = nlohmann::json::array();

    for (const auto& name : module_names) {
        const auto module = frontend::make_module_descriptor(base, name, generation->layout);

        frontend::DiagnosticSink diagnostics;
        auto result = codegen::regenerate(module, generation.value(), diagnostics);
        log_diagnostics(name, diagnostics);

        if (!result) {
            spdlog::error("{}: {}", name, result.error());
            ++failed;
            exit_code = 1;
            continue;
        }
        log_result(result.value());

        if (opts->check_only && result->has_stale_artifacts()) {
            ++stale;
            exit_code = 1;
        } else if (result->files_updated > 0) {
            ++updated;
        } else {
            ++unchanged;
        }

        if (opts->print_manifest) {
            auto module_json = codegen::to_json(result.value());
            module_json["root"] = module.root.string();
            modules_json.push_back(std::move(module_json));
        }
    }

    if (opts->print_manifest) {
        nlohmann::json output;
        output["modules"] = std::move(modules_json);
        fmt::print("{}\n", output.dump(2));
    }

    if (opts->check_only) {
        spdlog::info("Checked {} module(s): {} up to date, {} stale, {} failed", module_names.size(), unchanged,
                     stale, failed);
    } else {
        spdlog::info("Processed {} module(s): {} updated, {} unchanged, {} failed", module_names.size(), updated,
                     unchanged, failed);
    }

    return exit_code;
}

}  // namespace modsync
