#pragma once

#include "ast.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modsync::syntax::parser
{

struct AliasScanResult {
    std::vector<ast::AliasAnnotation> annotations;
    std::vector<ast::SyntaxError> errors;  ///< annotations that started as "[Alias(" but did not parse
};

/**
 * @brief Find every alias annotation in a function source text.
 *
 * The text is scanned for `[Alias(...)]` anywhere, comments included.
 *
 * @param text Whole content of a function source file.
 * @return Annotations in order of appearance, and malformed annotations as errors.
 */
AliasScanResult find_alias_annotations(const std::string& text);

/**
 * @brief Locate a `Name = value` assignment in a declarative manifest.
 *
 * The field name is matched case-insensitively and only as the first non-blank token of a line
 * outside `<# ... #>` block comments, so commented-out assignments are never picked up.
 *
 * @param text Whole content of the manifest.
 * @param field_name Name of the field, e.g. "FunctionsToExport".
 * @return The assignment, std::nullopt if the field is absent, or an error if its value is malformed.
 */
std::expected<std::optional<ast::FieldAssignment>, std::string> find_field_assignment(const std::string& text,
                                                                                        std::string_view field_name);

/**
 * @brief Parse a dotted version number ("1.2", "1.2.3", "1.2.3.4").
 *
 * @param text Version text.
 * @return Parsed version or error message.
 */
std::expected<ast::Version, std::string> parse_version(const std::string& text);

/**
 * @brief 1-based line and column of an offset in a text.
 */
std::pair<std::size_t, std::size_t> line_and_column(std::string_view text, std::size_t offset);

}  // namespace modsync::syntax::parser
