#pragma once

#include "ast.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/unused.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace modsync::syntax::parser
{

namespace x3 = boost::spirit::x3;

namespace rule
{

// comments and skipper
using LineComment = x3::rule<struct LineCommentRuleClass, x3::unused_type const>;
using BlockComment = x3::rule<struct BlockCommentRuleClass, x3::unused_type const>;
using Comment = x3::rule<struct CommentRuleClass, x3::unused_type const>;
using Skipper = x3::rule<struct SkipperRuleClass, x3::unused_type const>;

// tokens
using SingleQuoted = x3::rule<struct SingleQuotedRuleClass, std::string>;
using DoubleQuoted = x3::rule<struct DoubleQuotedRuleClass, std::string>;
using BareWord = x3::rule<struct BareWordRuleClass, std::string>;
using StringValue = x3::rule<struct StringValueRuleClass, std::string>;

// alias annotations
using AliasName = x3::rule<struct AliasNameRuleClass, std::string>;
using AliasNames = x3::rule<struct AliasNamesRuleClass, ast::NameList>;
using AliasAnnotation = x3::rule<struct AliasAnnotationRuleClass, ast::NameList>;

// manifest fields
using ArrayExpression = x3::rule<struct ArrayExpressionRuleClass, ast::NameList>;
using StringList = x3::rule<struct StringListRuleClass, ast::NameList>;
using FieldValue = x3::rule<struct FieldValueRuleClass, ast::NameList>;
using FieldAssignment = x3::rule<struct FieldAssignmentRuleClass, ast::NameList>;

// versions
using Version = x3::rule<struct VersionRuleClass, std::vector<std::uint32_t>>;

// clang-format off

// grammar hookup
BOOST_SPIRIT_DECLARE(
    LineComment,
    BlockComment,
    Comment,
    Skipper,
    SingleQuoted,
    DoubleQuoted,
    BareWord,
    StringValue,
    AliasName,
    AliasNames,
    AliasAnnotation,
    ArrayExpression,
    StringList,
    FieldValue,
    FieldAssignment,
    Version
)

// clang-format on
}  // namespace rule

rule::BlockComment block_comment();
rule::Skipper skipper();
rule::SingleQuoted single_quoted();
rule::DoubleQuoted double_quoted();
rule::BareWord bare_word();
rule::StringValue string_value();
rule::AliasName alias_name();
rule::AliasNames alias_names();
rule::AliasAnnotation alias_annotation();
rule::ArrayExpression array_expression();
rule::StringList string_list();
rule::FieldValue field_value();
rule::FieldAssignment field_assignment();
rule::Version version();

}  // namespace modsync::syntax::parser
