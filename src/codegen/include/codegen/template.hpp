#pragma once

#include <expected>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace modsync::codegen
{

/**
 * @brief A text skeleton with named placeholders.
 *
 * A placeholder is written `{{name}}`; blanks around the name are ignored. Rendering
 * substitutes every placeholder and fails on unknown or unterminated ones, so a typo in a
 * skeleton never reaches the disk.
 */
class Template
{
public:
    using Bindings = std::map<std::string, std::string, std::less<>>;

    explicit Template(std::string text);

    std::expected<std::string, std::string> render(const Bindings& bindings) const;

    /// Placeholder names in order of first appearance.
    std::expected<std::vector<std::string>, std::string> placeholders() const;

private:
    std::string _text;
};

}  // namespace modsync::codegen
