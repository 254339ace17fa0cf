#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <boost/spirit/home/x3.hpp>
#include <vector>

#include "syntax/ast.hpp"
#include "syntax/config.hpp"
#include "syntax/rules.hpp"

using namespace modsync::syntax;
using namespace modsync::syntax::parser;

template <typename Rule, typename Attr>
testing::AssertionResult parse_rule(const std::string& input,
                                    Rule const& rule,
                                    Attr& out)
{
    iterator_type first = input.begin();
    iterator_type last = input.end();

    // error handling
    ErrorCollector errors(first);
    auto const with_err = x3::with<x3::error_handler_tag>(std::ref(errors))[ rule ];

    bool ok = phrase_parse(first, last, with_err, skipper(), out);

    if (!ok) {
        auto failure = testing::AssertionFailure() << "parse failed for input: `" << input << "`";
        if (errors.error()) {
            failure << " (" << errors.error()->message << " at offset " << errors.error()->offset << ")";
        }
        return failure;
    }
    if (first != last) {
        return testing::AssertionFailure()
            << "parse did not consume full input. Remaining: `"
            << std::string(first, last) << "`";
    }
    return testing::AssertionSuccess();
}

template <typename Rule, typename Attr>
std::optional<ParseError> expect_failure(const std::string& input, Rule const& rule, Attr& out)
{
    iterator_type first = input.begin();
    iterator_type last = input.end();

    ErrorCollector errors(first);
    auto const with_err = x3::with<x3::error_handler_tag>(std::ref(errors))[ rule ];

    bool ok = phrase_parse(first, last, with_err, skipper(), out);
    EXPECT_FALSE(ok && first == last) << "unexpectedly parsed: `" << input << "`";
    return errors.error();
}

TEST(SyntaxRule, ParseSingleQuoted) {
    {
        std::string s;
        ASSERT_TRUE(parse_rule("'gcl'", single_quoted(), s));
        EXPECT_EQ(s, "gcl");
    }
    {
        // doubled quote is an escaped quote
        std::string s;
        ASSERT_TRUE(parse_rule("'it''s'", single_quoted(), s));
        EXPECT_EQ(s, "it's");
    }
    {
        // whitespace inside the quotes is kept
        std::string s;
        ASSERT_TRUE(parse_rule("' a b '", single_quoted(), s));
        EXPECT_EQ(s, " a b ");
    }
    {
        std::string s;
        ASSERT_TRUE(parse_rule("''", single_quoted(), s));
        EXPECT_EQ(s, "");
    }
}

TEST(SyntaxRule, ParseDoubleQuoted) {
    {
        std::string s;
        ASSERT_TRUE(parse_rule("\"gcl\"", double_quoted(), s));
        EXPECT_EQ(s, "gcl");
    }
    {
        std::string s;
        ASSERT_TRUE(parse_rule("\"say \"\"hi\"\"\"", double_quoted(), s));
        EXPECT_EQ(s, "say \"hi\"");
    }
}

TEST(SyntaxRule, ParseBareWord) {
    {
        std::string s;
        ASSERT_TRUE(parse_rule("Get-Thing", bare_word(), s));
        EXPECT_EQ(s, "Get-Thing");
    }
    {
        std::string s;
        ASSERT_TRUE(parse_rule("ls?.x_1", bare_word(), s));
        EXPECT_EQ(s, "ls?.x_1");
    }
    {
        std::string s;
        EXPECT_FALSE(parse_rule("a b", bare_word(), s));
    }
}

TEST(SyntaxRule, ParseAliasAnnotation) {
    {
        ast::NameList names;
        ASSERT_TRUE(parse_rule("[Alias('gcl')]", alias_annotation(), names));
        ASSERT_EQ(names.size(), 1);
        EXPECT_EQ(names[0], "gcl");
    }
    {
        ast::NameList names;
        ASSERT_TRUE(parse_rule("[Alias('a', \"b\", c)]", alias_annotation(), names));
        ASSERT_EQ(names.size(), 3);
        EXPECT_EQ(names[0], "a");
        EXPECT_EQ(names[1], "b");
        EXPECT_EQ(names[2], "c");
    }
    {
        // keyword is case-insensitive, whitespace and newlines between tokens
        ast::NameList names;
        ASSERT_TRUE(parse_rule("[ aLiAs (\n  'x' ,\n  'y'\n) ]", alias_annotation(), names));
        ASSERT_EQ(names.size(), 2);
        EXPECT_EQ(names[0], "x");
        EXPECT_EQ(names[1], "y");
    }
    {
        // comments between tokens
        ast::NameList names;
        ASSERT_TRUE(parse_rule("[Alias(<# first #> 'x', # second\n 'y')]", alias_annotation(), names));
        ASSERT_EQ(names.size(), 2);
        EXPECT_EQ(names[1], "y");
    }
}

TEST(SyntaxRule, AliasKeywordMustBeWholeWord) {
    ast::NameList names;
    EXPECT_FALSE(parse_rule("[Aliases('x')]", alias_annotation(), names));
    names.clear();
    EXPECT_FALSE(parse_rule("[CmdletBinding()]", alias_annotation(), names));
}

TEST(SyntaxRule, MalformedAliasAnnotationReportsPosition) {
    {
        // missing closing parenthesis
        ast::NameList names;
        auto error = expect_failure("[Alias('x' 'y')]", alias_annotation(), names);
        ASSERT_TRUE(error.has_value());
        EXPECT_GE(error->offset, 10u);
        EXPECT_LE(error->offset, 11u);
        EXPECT_NE(error->message.find("')'"), std::string::npos);
    }
    {
        // missing closing bracket
        ast::NameList names;
        auto error = expect_failure("[Alias('x')", alias_annotation(), names);
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->offset, 11u);
        EXPECT_NE(error->message.find("']'"), std::string::npos);
    }
    {
        // no names
        ast::NameList names;
        auto error = expect_failure("[Alias()]", alias_annotation(), names);
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->offset, 7u);
        EXPECT_EQ(error->message, "expected alias name list");
    }
    {
        // not an annotation at all is a plain mismatch, not an error
        ast::NameList names;
        auto error = expect_failure("[string]$Name", alias_annotation(), names);
        EXPECT_FALSE(error.has_value());
    }
}

TEST(SyntaxRule, ParseArrayExpression) {
    {
        ast::NameList values;
        ASSERT_TRUE(parse_rule("@()", array_expression(), values));
        EXPECT_TRUE(values.empty());
    }
    {
        ast::NameList values;
        ASSERT_TRUE(parse_rule("@('a', 'b')", array_expression(), values));
        ASSERT_EQ(values.size(), 2);
        EXPECT_EQ(values[0], "a");
        EXPECT_EQ(values[1], "b");
    }
    {
        // one entry per line, no commas, comments in between
        ast::NameList values;
        ASSERT_TRUE(parse_rule("@(\n    'a'\n    # skipped\n    \"b\"\n)", array_expression(), values));
        ASSERT_EQ(values.size(), 2);
        EXPECT_EQ(values[1], "b");
    }
}

TEST(SyntaxRule, ParseFieldValue) {
    {
        ast::NameList values;
        ASSERT_TRUE(parse_rule("'*'", field_value(), values));
        ASSERT_EQ(values.size(), 1);
        EXPECT_EQ(values[0], "*");
    }
    {
        ast::NameList values;
        ASSERT_TRUE(parse_rule("'a', 'b',\n 'c'", field_value(), values));
        EXPECT_EQ(values.size(), 3);
    }
    {
        ast::NameList values;
        ASSERT_TRUE(parse_rule("= @('x')", field_assignment(), values));
        ASSERT_EQ(values.size(), 1);
        EXPECT_EQ(values[0], "x");
    }
}

TEST(SyntaxRule, ParseVersion) {
    {
        std::vector<std::uint32_t> parts;
        ASSERT_TRUE(parse_rule("1.4.2", version(), parts));
        ASSERT_EQ(parts.size(), 3);
        EXPECT_EQ(parts[0], 1u);
        EXPECT_EQ(parts[1], 4u);
        EXPECT_EQ(parts[2], 2u);
    }
    {
        std::vector<std::uint32_t> parts;
        EXPECT_FALSE(parse_rule("1. 4", version(), parts));
    }
}
