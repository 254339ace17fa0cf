#include "codegen/manifest_patcher.hpp"

#include "codegen/loader.hpp"
#include "syntax/parser.hpp"
#include "write_joined.hpp"

#include <sstream>
#include <utility>

namespace modsync::codegen
{
namespace
{

void patch_field(PatchResult& result, std::string_view field, const std::vector<std::string>& values)
{
    auto located = syntax::parser::find_field_assignment(result.text, field);
    if (!located) {
        result.missing.push_back(FieldProblem{std::string(field), located.error()});
        return;
    }
    if (!located->has_value()) {
        result.missing.push_back(FieldProblem{std::string(field), "Field '" + std::string(field) + "' not found"});
        return;
    }

    const auto& assignment = located->value();
    // keep the spelling found in the file
    result.text.replace(assignment.begin, assignment.end - assignment.begin, render_field(assignment.name, values));
    result.replaced.emplace_back(field);
}

}  // namespace

std::string render_field(std::string_view field, const std::vector<std::string>& values)
{
    std::ostringstream out;
    out << field << " = @(";
    write_joined(
        out, values,
        [](const std::string& value) {
            return quote(value);
        },
        ", ");
    out << ")";
    return out.str();
}

PatchResult patch_manifest(const std::string& text, const ExportManifest& manifest)
{
    PatchResult result;
    result.text = text;

    // offsets are recomputed against the updated text for each field
    patch_field(result, kFunctionsField, manifest.functions);
    patch_field(result, kAliasesField, manifest.aliases);
    return result;
}

}  // namespace modsync::codegen
