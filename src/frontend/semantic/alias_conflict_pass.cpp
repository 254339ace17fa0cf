#include "alias_conflict_pass.hpp"

#include "semantic_context.hpp"

#include <map>

namespace modsync::frontend::semantic
{

void AliasConflictPass::run(Context& context)
{
    const auto& functions = context.function_index();
    std::map<std::string, const FunctionRecord*> owners;

    for (const auto& record : context.sources().functions) {
        if (record.work_in_progress) {
            continue;
        }
        for (const auto& alias : record.aliases) {
            if (functions.contains(alias)) {
                context.report_warning(record, "Alias '" + alias + "' of function '" + record.name +
                                                   "' has the same name as an exported function");
            }

            auto [it, inserted] = owners.emplace(alias, &record);
            if (!inserted && it->second->name != record.name) {
                context.report_warning(record, "Alias '" + alias + "' is declared by both '" + it->second->name +
                                                   "' and '" + record.name + "'; exported once");
            }
        }
    }
}

}  // namespace modsync::frontend::semantic
