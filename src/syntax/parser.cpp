#include "syntax/parser.hpp"

#include "syntax/config.hpp"
#include "syntax/rules.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/spirit/home/x3.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace modsync::syntax::parser
{
namespace
{

constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

template <typename Rule, typename Attribute>
bool parse_from(iterator_type& iter, iterator_type end, const Rule& rule, ErrorCollector& errors, Attribute& attr)
{
    // clang-format off
    const auto parser =
        x3::with<x3::error_handler_tag>(std::ref(errors))[
            rule
        ];
    // clang-format on

    return x3::phrase_parse(iter, end, parser, skipper(), attr, x3::skip_flag::dont_post_skip);
}

bool is_identifier_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::size_t offset_of(const std::string& text, iterator_type iter)
{
    return static_cast<std::size_t>(std::distance(text.cbegin(), iter));
}

using Range = std::pair<std::size_t, std::size_t>;

/// [begin, end) offsets of the <# ... #> comments; markers inside strings and line comments don't count.
/// An unterminated block comment runs to the end of the text.
std::vector<Range> block_comment_ranges(const std::string& text)
{
    std::vector<Range> ranges;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (c == '<' && pos + 1 < text.size() && text[pos + 1] == '#') {
            auto iter = text.cbegin() + static_cast<std::ptrdiff_t>(pos);
            if (!x3::parse(iter, text.cend(), block_comment())) {
                ranges.emplace_back(pos, text.size());
                break;
            }
            ranges.emplace_back(pos, offset_of(text, iter));
            pos = ranges.back().second;
        } else if (c == '#') {
            pos = text.find('\n', pos);
        } else if (c == '\'' || c == '"') {
            // a doubled quote closes and reopens, which lands in the same place
            pos = text.find(c, pos + 1);
            if (pos != std::string::npos) {
                ++pos;
            }
        } else {
            ++pos;
        }
    }
    return ranges;
}

bool is_inside(const std::vector<Range>& ranges, std::size_t offset)
{
    return std::any_of(ranges.begin(), ranges.end(), [offset](const Range& range) {
        return range.first <= offset && offset < range.second;
    });
}

}  // namespace

std::pair<std::size_t, std::size_t> line_and_column(std::string_view text, std::size_t offset)
{
    offset = std::min(offset, text.size());

    std::size_t line = 1;
    std::size_t column = 1;
    for (std::size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

AliasScanResult find_alias_annotations(const std::string& text)
{
    AliasScanResult result;
    const auto begin = text.cbegin();
    const auto end = text.cend();

    for (auto pos = text.find('['); pos != std::string::npos; pos = text.find('[', pos + 1)) {
        auto iter = begin + static_cast<std::ptrdiff_t>(pos);
        ErrorCollector errors{begin};
        ast::NameList names;

        if (parse_from(iter, end, alias_annotation(), errors, names)) {
            ast::AliasAnnotation annotation;
            annotation.line = line_and_column(text, pos).first;
            for (auto& name : names) {
                boost::algorithm::trim(name);
                if (!name.empty()) {
                    annotation.names.push_back(std::move(name));
                }
            }
            result.annotations.push_back(std::move(annotation));
            // resume right after the closing bracket
            pos = offset_of(text, iter) - 1;
        } else if (const auto& error = errors.error()) {
            auto [line, column] = line_and_column(text, error->offset);
            result.errors.push_back(ast::SyntaxError{line, column, "Malformed alias annotation: " + error->message});
        }
    }

    return result;
}

std::expected<std::optional<ast::FieldAssignment>, std::string> find_field_assignment(const std::string& text,
                                                                                        std::string_view field_name)
{
    const std::string_view view{text};
    const auto begin = text.cbegin();
    const auto end = text.cend();
    const auto comments = block_comment_ranges(text);

    std::size_t line = 0;
    std::size_t line_start = 0;
    while (line_start <= text.size()) {
        ++line;

        auto pos = line_start;
        if (pos == 0 && view.starts_with(kByteOrderMark)) {
            pos += kByteOrderMark.size();
        }
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
            ++pos;
        }

        const auto candidate = view.substr(pos, field_name.size());
        const auto after = pos + candidate.size();
        if (boost::algorithm::iequals(candidate, field_name) &&
            (after >= text.size() || !is_identifier_char(text[after])) && !is_inside(comments, pos)) {
            auto iter = begin + static_cast<std::ptrdiff_t>(after);
            ErrorCollector errors{begin};
            ast::NameList values;

            if (parse_from(iter, end, field_assignment(), errors, values)) {
                ast::FieldAssignment assignment;
                assignment.name = std::string(candidate);
                assignment.values = std::move(values);
                assignment.begin = pos;
                assignment.end = offset_of(text, iter);
                assignment.line = line;
                return std::optional<ast::FieldAssignment>{std::move(assignment)};
            }

            if (const auto& error = errors.error()) {
                auto [error_line, error_column] = line_and_column(text, error->offset);
                return std::unexpected("Malformed value of '" + std::string(field_name) + "' at line " +
                                       std::to_string(error_line) + ", column " + std::to_string(error_column) +
                                       ": " + error->message);
            }
        }

        const auto next = text.find('\n', line_start);
        if (next == std::string::npos) {
            break;
        }
        line_start = next + 1;
    }

    return std::optional<ast::FieldAssignment>{};
}

std::expected<ast::Version, std::string> parse_version(const std::string& text)
{
    auto iter = text.cbegin();
    const auto end = text.cend();

    ErrorCollector errors{iter};
    std::vector<std::uint32_t> parts;
    const bool ok = parse_from(iter, end, version(), errors, parts);

    while (iter != end && std::isspace(static_cast<unsigned char>(*iter))) {
        ++iter;
    }

    if (!ok || iter != end) {
        return std::unexpected("Invalid version '" + text + "'");
    }
    if (parts.size() < 2 || parts.size() > 4) {
        return std::unexpected("Invalid version '" + text + "': expected 2 to 4 components");
    }

    return ast::Version{std::move(parts)};
}

}  // namespace modsync::syntax::parser
