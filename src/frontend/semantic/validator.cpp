#include "frontend/semantic/validator.hpp"

#include "alias_conflict_pass.hpp"
#include "function_index_pass.hpp"
#include "semantic_context.hpp"
#include "work_in_progress_pass.hpp"

#include <algorithm>

namespace modsync::frontend::semantic
{

Validator::Validator(const ModuleSources& sources, DiagnosticSink& sink)
    : sources_(sources)
    , sink_(sink)
{
    // alias conflicts read the function index
    add_pass<FunctionIndexPass>();
    add_pass<AliasConflictPass>();
    add_pass<WorkInProgressPass>();
}

Validator::~Validator() = default;

void Validator::append(std::unique_ptr<Pass> pass)
{
    if (pass) {
        passes_.push_back(std::move(pass));
    }
}

bool Validator::remove_pass(std::string_view name)
{
    auto it = std::find_if(passes_.begin(), passes_.end(), [name](const auto& pass) {
        return pass->name() == name;
    });
    if (it == passes_.end()) {
        return false;
    }
    passes_.erase(it);
    return true;
}

void Validator::remove_all_passes()
{
    passes_.clear();
}

std::vector<std::string> Validator::pass_names() const
{
    std::vector<std::string> names;
    names.reserve(passes_.size());
    for (const auto& pass : passes_) {
        names.push_back(pass->name());
    }
    return names;
}

void Validator::run()
{
    Context context{sources_, sink_};
    for (auto& pass : passes_) {
        pass->run(context);
    }
}

}  // namespace modsync::frontend::semantic
