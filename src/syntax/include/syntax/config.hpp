#pragma once

#include "rules.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>

namespace modsync::syntax::parser
{

namespace x3 = boost::spirit::x3;

using iterator_type = std::string::const_iterator;

struct ParseError {
    std::size_t offset = 0;  ///< offset of the failing position in the parsed buffer
    std::string message;
};

/**
 * @brief Collects the first expectation failure raised while parsing a buffer.
 *
 * Stored in the parser context under x3::error_handler_tag, so rules with an
 * on_error handler can report where they failed.
 */
class ErrorCollector
{
public:
    explicit ErrorCollector(iterator_type first)
        : _first(first)
    {
    }

    void operator()(iterator_type where, const std::string& message)
    {
        if (!_error) {
            _error = ParseError{static_cast<std::size_t>(std::distance(_first, where)), message};
        }
    }

    const std::optional<ParseError>& error() const
    {
        return _error;
    }

    void clear()
    {
        _error.reset();
    }

private:
    iterator_type _first;
    std::optional<ParseError> _error;
};

using skipper_context_type = x3::phrase_parse_context<rule::Skipper>::type;

// clang-format off
using context_type =
    x3::context<
        x3::error_handler_tag,
        std::reference_wrapper<ErrorCollector>,
        skipper_context_type>;
// clang-format on

}  // namespace modsync::syntax::parser
