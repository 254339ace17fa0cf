#pragma once

#include "codegen/artifact.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace modsync::codegen
{

/**
 * @brief Normalize generated text for comparison.
 *
 * Strips a UTF-8 byte order mark, turns CRLF and lone CR into LF and trims surrounding whitespace.
 */
std::string normalize(std::string_view text);

/**
 * @brief Write content to a file unless the file already holds the same normalized content.
 *
 * The file is replaced wholesale through a temporary sibling and a rename, so it either keeps
 * its previous content or receives the complete new one.
 *
 * @param path Target file.
 * @param content Content to write or error message.
 * @param options Check-only and line ending options.
 * @return Unchanged, Updated or Stale; or error message.
 */
std::expected<ArtifactStatus, std::string> write_file_if_changed(const std::filesystem::path& path,
                                                                 std::expected<std::string, std::string> content,
                                                                 const WriteOptions& options = {});

}  // namespace modsync::codegen
