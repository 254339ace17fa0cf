#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace modsync::frontend
{

enum class Severity {
    Note,
    Warning,
};

struct SourceLocation {
    std::string file;
    size_t line = 0;  ///< 0 when the diagnostic concerns the whole file
    size_t column = 0;
};

struct Diagnostic {
    Severity severity;
    SourceLocation location;
    std::string message;
};

/**
 * @brief Sink for diagnostics.
 *
 * This class is used to collect diagnostics while scanning, validating and
 * regenerating a module. Failures that stop a module are returned as errors instead.
 */
class DiagnosticSink
{
public:
    void report(Severity severity, SourceLocation location, std::string message);
    void warning(SourceLocation location, std::string message);
    void note(SourceLocation location, std::string message);

    bool has_warnings() const;
    bool has_notes() const;
    std::size_t count(Severity severity) const;
    void clear();

    const std::vector<Diagnostic>& diagnostics() const;

private:
    std::vector<Diagnostic> _diagnostics;
};

/**
 * @brief Format a diagnostic location as "file:line:column", "file:line" or "file".
 */
std::string to_string(const SourceLocation& location);

}  // namespace modsync::frontend
