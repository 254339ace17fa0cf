#pragma once

#include "syntax/ast.hpp"
#include "rules.hpp"

/**
 * @file rules_definition.hpp
 * @brief Spirit rules definitions
 *
 * This file contains the Spirit rules for the small slice of PowerShell syntax modsync
 * understands: alias annotations in function sources, field assignments in manifests and
 * dotted version numbers.
 *
 * @note This file is included in exactly one module, hence the NOLINT.
 *
 */
// NOLINTBEGIN(misc-definitions-in-headers)

namespace modsync::syntax::parser
{

namespace rule
{

namespace x3 = boost::spirit::x3;

// -------------- helpers --------------
inline auto make_kw(const char* s)
{
    return x3::lexeme[x3::no_case[x3::lit(s)] >> !(x3::alnum | x3::char_('_'))];
}

// clang-format off
// ... to make the rules more readable

const auto kw_alias = make_kw("alias");

// skipper
LineComment line_comment = "line_comment";
BlockComment block_comment = "block_comment";
Comment comment = "comment";
Skipper skipper = "skipper";

// The skipper is always invoked without a skipper of its own, so no lexeme[] is needed here.
const auto line_comment_def = '#' >> *(x3::char_ - x3::eol) >> (x3::eol | x3::eoi);
const auto block_comment_def = "<#" >> *(x3::char_ - "#>") >> "#>";
const auto comment_def = block_comment | line_comment;
const auto skipper_def = comment | x3::space;

// tokens
SingleQuoted single_quoted = "single_quoted";
DoubleQuoted double_quoted = "double_quoted";
BareWord bare_word = "bare_word";
StringValue string_value = "string";

// '' inside a single-quoted string is an escaped quote
const auto single_quoted_def =
    x3::lexeme[
        '\''
        >> *((x3::lit("''") >> x3::attr('\'')) | ~x3::char_('\''))
        >> '\''
    ];

const auto double_quoted_def =
    x3::lexeme[
        '"'
        >> *((x3::lit("\"\"") >> x3::attr('"')) | ~x3::char_('"'))
        >> '"'
    ];

const auto bare_word_def =
    x3::lexeme[
        +(x3::alnum | x3::char_('-') | x3::char_('_') | x3::char_('.') | x3::char_('?'))
    ];

const auto string_value_def = single_quoted | double_quoted;

// -------------- alias annotations --------------
AliasName alias_name = "alias name";
AliasNames alias_names = "alias name list";
AliasAnnotation alias_annotation = "alias_annotation";

const auto alias_name_def = string_value | bare_word;

const auto alias_names_def = alias_name % ',';

// [Alias('a', "b", c)]; once "[Alias(" matched, the rest is expected
const auto alias_annotation_def =
    x3::lit('[') >> kw_alias >> '('
    > alias_names
    > ')'
    > ']';

// -------------- manifest fields --------------
ArrayExpression array_expression = "array_expression";
StringList string_list = "string_list";
FieldValue field_value = "field_value";
FieldAssignment field_assignment = "field_assignment";

// @('a', 'b') or @( 'a' <newline> 'b' ); separating commas are optional
const auto array_expression_def =
    x3::lit("@(")
    > *(string_value >> -x3::lit(','))
    > ')';

const auto string_list_def = string_value % ',';

const auto field_value_def = array_expression | string_list;

const auto field_assignment_def = '=' >> field_value;

// -------------- versions --------------
Version version = "version";

const auto version_def = x3::lexeme[x3::uint32 % '.'];

// clang-format on

BOOST_SPIRIT_DEFINE(line_comment, block_comment, comment, skipper, single_quoted, double_quoted, bare_word,
                    string_value, alias_name, alias_names, alias_annotation, array_expression, string_list,
                    field_value, field_assignment, version)

}  // namespace rule

rule::BlockComment block_comment()
{
    return rule::block_comment;
}

rule::Skipper skipper()
{
    return rule::skipper;
}

rule::SingleQuoted single_quoted()
{
    return rule::single_quoted;
}

rule::DoubleQuoted double_quoted()
{
    return rule::double_quoted;
}

rule::BareWord bare_word()
{
    return rule::bare_word;
}

rule::StringValue string_value()
{
    return rule::string_value;
}

rule::AliasName alias_name()
{
    return rule::alias_name;
}

rule::AliasNames alias_names()
{
    return rule::alias_names;
}

rule::AliasAnnotation alias_annotation()
{
    return rule::alias_annotation;
}

rule::ArrayExpression array_expression()
{
    return rule::array_expression;
}

rule::StringList string_list()
{
    return rule::string_list;
}

rule::FieldValue field_value()
{
    return rule::field_value;
}

rule::FieldAssignment field_assignment()
{
    return rule::field_assignment;
}

rule::Version version()
{
    return rule::version;
}

}  // namespace modsync::syntax::parser

// NOLINTEND(misc-definitions-in-headers)
