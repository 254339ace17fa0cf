#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace modsync::frontend
{

/// Directory names inside a module root.
struct ModuleLayout {
    std::string public_dir = "Public";
    std::string private_dir = "Private";
};

/// Which files count as function sources.
struct ScanOptions {
    std::string extension = ".ps1";  ///< compared case-insensitively, leading dot included
    std::string wip_suffix = "-wip";  ///< stem suffix of work-in-progress files, compared case-insensitively
};

struct ModuleDescriptor {
    std::string name;                   ///< Module name, also the stem of the generated files
    std::filesystem::path root;         ///< <base>/<name>
    std::filesystem::path public_dir;   ///< Scanned for exported functions
    std::filesystem::path private_dir;  ///< Loaded by the loader script, never exported

    std::filesystem::path loader_path() const
    {
        return root / (name + ".psm1");
    }

    std::filesystem::path manifest_path() const
    {
        return root / (name + ".psd1");
    }
};

ModuleDescriptor make_module_descriptor(const std::filesystem::path& base, const std::string& name,
                                        const ModuleLayout& layout = {});

struct FunctionRecord {
    std::string name;                  ///< File stem, used verbatim as the exported function name
    std::filesystem::path path;        ///< Full path of the source file
    std::vector<std::string> aliases;  ///< Declared aliases, first occurrence order, no duplicates
    bool work_in_progress = false;     ///< Discovered but never exported
};

struct ModuleSources {
    ModuleDescriptor module;
    std::vector<FunctionRecord> functions;  ///< Every readable candidate, in path order
    std::size_t files_discovered = 0;       ///< Candidates found, readable or not
    std::size_t files_unreadable = 0;

    std::size_t files_work_in_progress() const;
};

}  // namespace modsync::frontend
