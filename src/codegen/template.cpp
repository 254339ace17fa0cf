#include "codegen/template.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <string_view>

namespace modsync::codegen
{
namespace
{

constexpr std::string_view kOpen = "{{";
constexpr std::string_view kClose = "}}";

std::size_t line_of(const std::string& text, std::size_t offset)
{
    return 1 + static_cast<std::size_t>(std::count(text.begin(), text.begin() + offset, '\n'));
}

/// Calls literal(text) and placeholder(name, offset) in order of appearance; stops at the first error.
template <typename Literal, typename Placeholder>
std::expected<void, std::string> walk(const std::string& text, Literal&& literal, Placeholder&& placeholder)
{
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find(kOpen, pos);
        if (open == std::string::npos) {
            literal(std::string_view(text).substr(pos));
            break;
        }
        literal(std::string_view(text).substr(pos, open - pos));

        const auto close = text.find(kClose, open + kOpen.size());
        if (close == std::string::npos) {
            return std::unexpected(fmt::format("Unterminated placeholder at line {}", line_of(text, open)));
        }

        auto name = text.substr(open + kOpen.size(), close - open - kOpen.size());
        boost::algorithm::trim(name);
        if (auto result = placeholder(name, open); !result) {
            return result;
        }
        pos = close + kClose.size();
    }
    return {};
}

}  // namespace

Template::Template(std::string text)
    : _text(std::move(text))
{
}

std::expected<std::string, std::string> Template::render(const Bindings& bindings) const
{
    std::string out;
    out.reserve(_text.size());

    auto append_literal = [&out](std::string_view literal) {
        out.append(literal);
    };
    auto substitute = [&](const std::string& name, std::size_t offset) -> std::expected<void, std::string> {
        auto it = bindings.find(name);
        if (it == bindings.end()) {
            return std::unexpected(
                fmt::format("Unknown placeholder '{{{{{}}}}}' at line {}", name, line_of(_text, offset)));
        }
        out += it->second;
        return {};
    };

    if (auto result = walk(_text, append_literal, substitute); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

std::expected<std::vector<std::string>, std::string> Template::placeholders() const
{
    std::vector<std::string> names;
    auto ignore_literal = [](std::string_view) {};
    auto collect = [&names](const std::string& name, std::size_t) -> std::expected<void, std::string> {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
        return {};
    };

    if (auto result = walk(_text, ignore_literal, collect); !result) {
        return std::unexpected(result.error());
    }
    return names;
}

}  // namespace modsync::codegen
