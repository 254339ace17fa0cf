#include "frontend/frontend.hpp"

#include "syntax/parser.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace modsync::frontend
{

namespace fs = std::filesystem;

std::expected<ModuleSources, std::string> scan_module(const ModuleDescriptor& module, const ScanOptions& options,
                                                      DiagnosticSink& diagnostics)
{
    std::error_code ec;
    if (!fs::is_directory(module.public_dir, ec)) {
        return std::unexpected("Public directory '" + module.public_dir.string() + "' does not exist");
    }

    auto candidates = detail::list_candidates(module.public_dir, options.extension);
    if (!candidates) {
        return std::unexpected(candidates.error());
    }

    ModuleSources sources;
    sources.module = module;
    sources.files_discovered = candidates->size();

    for (const auto& path : candidates.value()) {
        auto content = detail::read_file(path);
        if (!content) {
            diagnostics.warning({path.string()}, "Skipping unreadable file: " + content.error());
            ++sources.files_unreadable;
            continue;
        }

        auto record = detail::make_function_record(path, content.value(), options, diagnostics);
        spdlog::debug("{}: function '{}'{}, {} alias(es)", path.string(), record.name,
                      record.work_in_progress ? " (work in progress)" : "", record.aliases.size());
        sources.functions.push_back(std::move(record));
    }

    return sources;
}

std::expected<std::vector<std::string>, std::string> discover_modules(const fs::path& base,
                                                                      const ModuleLayout& layout)
{
    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return std::unexpected("Root directory '" + base.string() + "' does not exist");
    }

    fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected("Failed to list directory: " + base.string() + ": " + ec.message());
    }

    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && fs::is_directory(it->path() / layout.public_dir, entry_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return std::unexpected("Failed to list directory: " + base.string() + ": " + ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

bool is_work_in_progress(const std::string& stem, const std::string& wip_suffix)
{
    return !wip_suffix.empty() && boost::algorithm::iends_with(stem, wip_suffix);
}

namespace detail
{

std::expected<std::string, std::string> read_file(const fs::path& path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return std::unexpected("Failed to open file: " + path.string() + ": " + ec.message());
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected("Failed to open file: " + path.string());
    }

    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected("Failed to read file: " + path.string() + ": " + ec.message());
    }

    std::string content(file_size, '\0');
    if (!file.read(content.data(), static_cast<std::streamsize>(content.size()))) {
        return std::unexpected("Failed to read file: " + path.string());
    }

    return content;
}

std::expected<std::vector<fs::path>, std::string> list_candidates(const fs::path& dir, const std::string& extension)
{
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected("Failed to list directory: " + dir.string() + ": " + ec.message());
    }

    std::vector<fs::path> candidates;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        // broken links stay candidates so that reading them reports a warning
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            continue;
        }
        if (boost::algorithm::iequals(it->path().extension().string(), extension)) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        return std::unexpected("Failed to list directory: " + dir.string() + ": " + ec.message());
    }

    std::sort(candidates.begin(), candidates.end());
    return candidates;
}

FunctionRecord make_function_record(const fs::path& path, const std::string& content, const ScanOptions& options,
                                    DiagnosticSink& diagnostics)
{
    FunctionRecord record;
    record.path = path;
    record.name = path.stem().string();
    record.work_in_progress = is_work_in_progress(record.name, options.wip_suffix);

    auto scan = syntax::parser::find_alias_annotations(content);
    for (const auto& error : scan.errors) {
        diagnostics.warning({path.string(), error.line, error.column}, error.message);
    }

    for (auto& annotation : scan.annotations) {
        for (auto& alias : annotation.names) {
            if (std::find(record.aliases.begin(), record.aliases.end(), alias) == record.aliases.end()) {
                record.aliases.push_back(std::move(alias));
            }
        }
    }

    return record;
}

}  // namespace detail

}  // namespace modsync::frontend
