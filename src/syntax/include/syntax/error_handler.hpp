#pragma once

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>

#include <string>

namespace modsync::syntax::parser
{

namespace x3 = boost::spirit::x3;

struct GenericParsingErrorHandler {
    template <typename Iterator, typename Exception, typename Context>
    x3::error_handler_result on_error(Iterator& first, Iterator const& last, Exception const& e,
                                      Context const& context)
    {
        auto& error_handler = x3::get<x3::error_handler_tag>(context).get();
        error_handler(e.where(), "expected " + e.which());
        return x3::error_handler_result::fail;
    }
};

}  // namespace modsync::syntax::parser
