#include "frontend/module.hpp"

#include <algorithm>

namespace modsync::frontend
{

ModuleDescriptor make_module_descriptor(const std::filesystem::path& base, const std::string& name,
                                        const ModuleLayout& layout)
{
    ModuleDescriptor module;
    module.name = name;
    module.root = base / name;
    module.public_dir = module.root / layout.public_dir;
    module.private_dir = module.root / layout.private_dir;
    return module;
}

std::size_t ModuleSources::files_work_in_progress() const
{
    auto is_wip = [](const FunctionRecord& record) {
        return record.work_in_progress;
    };
    return static_cast<std::size_t>(std::count_if(functions.begin(), functions.end(), is_wip));
}

}  // namespace modsync::frontend
