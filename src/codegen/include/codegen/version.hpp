#pragma once

#include "codegen/artifact.hpp"
#include "syntax/ast.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace modsync::codegen
{

inline constexpr std::string_view kModuleVersionField = "ModuleVersion";

enum class BumpLevel {
    Major,
    Minor,
    Patch,
};

std::expected<BumpLevel, std::string> parse_bump_level(std::string_view text);
std::string_view to_string(BumpLevel level);

/**
 * @brief Increment one component of a version and reset the lower ones.
 *
 * The result always has at least three components: 1.4 bumped by Patch is 1.4.1.
 * Fails if the bumped component is already at its maximum.
 */
std::expected<syntax::ast::Version, std::string> bump_version(syntax::ast::Version version, BumpLevel level);

struct VersionBump {
    std::string previous;
    std::string current;
    ArtifactStatus status = ArtifactStatus::Skipped;
};

/**
 * @brief Bump the `ModuleVersion` field of a manifest in place.
 *
 * @param manifest_path Manifest to update.
 * @param level Component to increment.
 * @param options Check-only mode leaves the file untouched and reports Stale.
 * @return Previous and new version, or error message.
 */
std::expected<VersionBump, std::string> bump_module_version(const std::filesystem::path& manifest_path,
                                                            BumpLevel level, const WriteOptions& options = {});

}  // namespace modsync::codegen
