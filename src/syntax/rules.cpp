#include "syntax/config.hpp"
#include "syntax/error_handler.hpp"
#include "syntax/rules_definition.hpp"

#include <boost/spirit/home/x3.hpp>

namespace modsync::syntax::parser::rule
{

// Rules that report expectation failures; must be complete before the instantiations below.
struct AliasAnnotationRuleClass : GenericParsingErrorHandler {
};

struct ArrayExpressionRuleClass : GenericParsingErrorHandler {
};

BOOST_SPIRIT_INSTANTIATE(BlockComment, iterator_type, boost::spirit::x3::unused_type);
BOOST_SPIRIT_INSTANTIATE(Skipper, iterator_type, boost::spirit::x3::unused_type);
BOOST_SPIRIT_INSTANTIATE(SingleQuoted, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(DoubleQuoted, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(BareWord, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(StringValue, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(AliasName, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(AliasNames, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(AliasAnnotation, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(ArrayExpression, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(StringList, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(FieldValue, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(FieldAssignment, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Version, iterator_type, context_type);

}  // namespace modsync::syntax::parser::rule
