#include "function_index_pass.hpp"

#include "semantic_context.hpp"

namespace modsync::frontend::semantic
{

void FunctionIndexPass::run(Context& context)
{
    auto& index = context.function_index();
    index.clear();

    for (const auto& record : context.sources().functions) {
        if (record.work_in_progress) {
            continue;
        }
        auto [it, inserted] = index.emplace(record.name, &record);
        if (!inserted) {
            context.report_warning(record, "Function '" + record.name + "' already defined in " +
                                               it->second->path.string() + "; exported once");
        }
    }
}

}  // namespace modsync::frontend::semantic
