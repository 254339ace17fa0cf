#pragma once

#include "frontend/diagnostic.hpp"
#include "frontend/module.hpp"

#include <map>
#include <string>

namespace modsync::frontend::semantic {

class Context
{
public:
    /// Exported (non work-in-progress) functions by name, first file in path order wins.
    using FunctionIndex = std::map<std::string, const FunctionRecord*>;

    Context(const ModuleSources& sources, DiagnosticSink& sink);

    const ModuleSources& sources() const;

    FunctionIndex& function_index();
    const FunctionIndex& function_index() const;

    void report_warning(const FunctionRecord& record, const std::string& message) const;
    void report_note(const FunctionRecord& record, const std::string& message) const;

private:
    void report(Severity severity, const FunctionRecord& record, const std::string& message) const;

    const ModuleSources& sources_;
    DiagnosticSink& sink_;
    FunctionIndex functions_;
};

}  // namespace modsync::frontend::semantic
