#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace modsync::syntax::ast
{

using NameList = std::vector<std::string>;

// ---------- alias annotations ----------

/// One `[Alias(...)]` annotation found in a function source file.
struct AliasAnnotation {
    NameList names;        ///< alias names, unquoted and trimmed, empty names dropped
    std::size_t line = 0;  ///< 1-based line of the opening bracket
};

// ---------- manifest fields ----------

/**
 * @brief A `Name = value` assignment located inside a declarative manifest.
 *
 * The offsets cover the whole assignment, from the first character of the field name
 * to one past the last character of the value, so the assignment can be replaced in place.
 */
struct FieldAssignment {
    std::string name;       ///< field name as spelled in the file
    NameList values;        ///< unquoted string values
    std::size_t begin = 0;  ///< offset of the field name
    std::size_t end = 0;    ///< offset one past the value
    std::size_t line = 0;   ///< 1-based line of the field name
};

// ---------- versions ----------

struct Version {
    std::vector<std::uint32_t> parts;  // e.g., {1, 4, 2}

    std::string to_string() const
    {
        std::string out;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i)
                out += '.';
            out += std::to_string(parts[i]);
        }
        return out;
    }
};

// ---------- errors ----------

struct SyntaxError {
    std::size_t line = 0;
    std::size_t column = 0;
    std::string message;
};

}  // namespace modsync::syntax::ast
