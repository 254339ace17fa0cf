#pragma once

#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/algorithm/copy.hpp>

#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace modsync::codegen
{

constexpr int kIndentWidth = 4;

inline std::string indentation(int indent_level)
{
    return std::string(indent_level * kIndentWidth, ' ');
}

/// Output iterator writing each assigned value to a stream, separated by a delimiter.
class JoiningWriter
{
public:
    using iterator_category = std::output_iterator_tag;
    using value_type = void;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = void;

    JoiningWriter(std::ostream& out, std::string delimiter)
        : _out(&out)
        , _delimiter(std::move(delimiter))
    {
    }

    template <typename T>
    JoiningWriter& operator=(const T& value)
    {
        if (_written) {
            *_out << _delimiter;
        }
        *_out << value;
        _written = true;
        return *this;
    }

    JoiningWriter& operator*()
    {
        return *this;
    }

    JoiningWriter& operator++()
    {
        return *this;
    }

    JoiningWriter& operator++(int)
    {
        return *this;
    }

private:
    std::ostream* _out;
    std::string _delimiter;
    bool _written = false;
};

/// Write `transformer(item)` for each item of the range, separated by `delimiter`.
template <typename Range, typename Transformer>
void write_joined(std::ostream& os, const Range& range, Transformer&& transformer, std::string_view delimiter)
{
    using namespace boost::adaptors;
    boost::copy(range | transformed(std::forward<Transformer>(transformer)),
                JoiningWriter{os, std::string(delimiter)});
}

}  // namespace modsync::codegen
