#include "semantic_context.hpp"

namespace modsync::frontend::semantic
{

Context::Context(const ModuleSources& sources, DiagnosticSink& sink)
    : sources_(sources)
    , sink_(sink)
{
}

const ModuleSources& Context::sources() const
{
    return sources_;
}

Context::FunctionIndex& Context::function_index()
{
    return functions_;
}

const Context::FunctionIndex& Context::function_index() const
{
    return functions_;
}

void Context::report(Severity severity, const FunctionRecord& record, const std::string& message) const
{
    sink_.report(severity, SourceLocation{record.path.string()}, message);
}

void Context::report_warning(const FunctionRecord& record, const std::string& message) const
{
    report(Severity::Warning, record, message);
}

void Context::report_note(const FunctionRecord& record, const std::string& message) const
{
    report(Severity::Note, record, message);
}

}  // namespace modsync::frontend::semantic
