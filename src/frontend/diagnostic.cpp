#include "frontend/diagnostic.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace modsync::frontend
{

void DiagnosticSink::report(Severity severity, SourceLocation location, std::string message)
{
    _diagnostics.push_back(Diagnostic{severity, std::move(location), std::move(message)});
}

void DiagnosticSink::warning(SourceLocation location, std::string message)
{
    report(Severity::Warning, std::move(location), std::move(message));
}

void DiagnosticSink::note(SourceLocation location, std::string message)
{
    report(Severity::Note, std::move(location), std::move(message));
}

bool DiagnosticSink::has_warnings() const
{
    return count(Severity::Warning) > 0;
}

bool DiagnosticSink::has_notes() const
{
    return count(Severity::Note) > 0;
}

std::size_t DiagnosticSink::count(Severity severity) const
{
    auto matches = [severity](const auto& d) {
        return d.severity == severity;
    };
    return static_cast<std::size_t>(std::count_if(_diagnostics.begin(), _diagnostics.end(), matches));
}

void DiagnosticSink::clear()
{
    _diagnostics.clear();
}

const std::vector<Diagnostic>& DiagnosticSink::diagnostics() const
{
    return _diagnostics;
}

std::string to_string(const SourceLocation& location)
{
    if (location.line == 0) {
        return location.file;
    }
    if (location.column == 0) {
        return fmt::format("{}:{}", location.file, location.line);
    }
    return fmt::format("{}:{}:{}", location.file, location.line, location.column);
}

}  // namespace modsync::frontend
