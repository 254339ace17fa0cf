#include "work_in_progress_pass.hpp"

#include "semantic_context.hpp"

namespace modsync::frontend::semantic
{

void WorkInProgressPass::run(Context& context)
{
    for (const auto& record : context.sources().functions) {
        if (!record.work_in_progress || record.aliases.empty()) {
            continue;
        }

        std::string names;
        for (const auto& alias : record.aliases) {
            if (!names.empty()) {
                names += ", ";
            }
            names += alias;
        }
        context.report_note(record, "Aliases of work-in-progress function '" + record.name +
                                        "' are not exported: " + names);
    }
}

}  // namespace modsync::frontend::semantic
