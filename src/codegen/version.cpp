#include "codegen/version.hpp"

#include "codegen/file_writer.hpp"
#include "codegen/loader.hpp"
#include "frontend/frontend.hpp"
#include "syntax/parser.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/format.h>

#include <limits>

namespace modsync::codegen
{

std::expected<BumpLevel, std::string> parse_bump_level(std::string_view text)
{
    const auto lowered = boost::algorithm::to_lower_copy(std::string(text));
    if (lowered == "major") {
        return BumpLevel::Major;
    }
    if (lowered == "minor") {
        return BumpLevel::Minor;
    }
    if (lowered == "patch") {
        return BumpLevel::Patch;
    }
    return std::unexpected("Unknown version bump level '" + std::string(text) + "' (expected major, minor or patch)");
}

std::string_view to_string(BumpLevel level)
{
    switch (level) {
        case BumpLevel::Major:
            return "major";
        case BumpLevel::Minor:
            return "minor";
        case BumpLevel::Patch:
            return "patch";
    }
    return "unknown";
}

std::expected<syntax::ast::Version, std::string> bump_version(syntax::ast::Version version, BumpLevel level)
{
    if (version.parts.size() < 3) {
        version.parts.resize(3, 0);
    }

    const auto index = static_cast<std::size_t>(level);
    if (version.parts[index] == std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(
            fmt::format("Cannot bump {} version of '{}': component overflows", to_string(level), version.to_string()));
    }
    ++version.parts[index];
    for (auto i = index + 1; i < version.parts.size(); ++i) {
        version.parts[i] = 0;
    }
    return version;
}

std::expected<VersionBump, std::string> bump_module_version(const std::filesystem::path& manifest_path,
                                                            BumpLevel level, const WriteOptions& options)
{
    auto text = frontend::detail::read_file(manifest_path);
    if (!text) {
        return std::unexpected(text.error());
    }

    auto located = syntax::parser::find_field_assignment(text.value(), kModuleVersionField);
    if (!located) {
        return std::unexpected(located.error());
    }
    if (!located->has_value()) {
        return std::unexpected("Field '" + std::string(kModuleVersionField) + "' not found in " +
                               manifest_path.string());
    }

    const auto& assignment = located->value();
    if (assignment.values.size() != 1) {
        return std::unexpected("Field '" + std::string(kModuleVersionField) + "' in " + manifest_path.string() +
                               " must hold a single version string");
    }

    auto version = syntax::parser::parse_version(assignment.values.front());
    if (!version) {
        return std::unexpected(version.error());
    }

    VersionBump bump;
    bump.previous = version->to_string();
    auto bumped = bump_version(std::move(version.value()), level);
    if (!bumped) {
        return std::unexpected(bumped.error());
    }
    bump.current = bumped->to_string();

    auto patched = text.value();
    patched.replace(assignment.begin, assignment.end - assignment.begin,
                    assignment.name + " = " + quote(bump.current));

    // keep the manifest's own line endings
    WriteOptions write_options = options;
    write_options.crlf = false;
    auto status = write_file_if_changed(manifest_path, std::move(patched), write_options);
    if (!status) {
        return std::unexpected(status.error());
    }
    bump.status = status.value();
    return bump;
}

}  // namespace modsync::codegen
