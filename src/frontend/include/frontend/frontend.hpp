#pragma once

#include "frontend/diagnostic.hpp"
#include "frontend/module.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace modsync::frontend
{

/**
 * @brief Scan the public directory of a module into function records.
 *
 * Unreadable files are reported as warnings and skipped; malformed alias annotations
 * are reported as warnings and the rest of the file is still honored.
 *
 * @param module Module to scan.
 * @param options Extension and work-in-progress suffix.
 * @param diagnostics Sink for per-file problems.
 * @return Scanned sources, or an error if the public directory is missing.
 */
std::expected<ModuleSources, std::string> scan_module(const ModuleDescriptor& module, const ScanOptions& options,
                                                      DiagnosticSink& diagnostics);

/**
 * @brief Find module roots under a base directory.
 *
 * A module root is a direct sub-directory of the base that contains the public directory.
 *
 * @param base Base directory.
 * @param layout Directory names inside a module.
 * @return Module names in sorted order, or error message.
 */
std::expected<std::vector<std::string>, std::string> discover_modules(const std::filesystem::path& base,
                                                                      const ModuleLayout& layout = {});

/**
 * @brief Tell whether a file stem carries the work-in-progress suffix.
 */
bool is_work_in_progress(const std::string& stem, const std::string& wip_suffix);

namespace detail
{

/**
 * @brief Read a file into a string.
 *
 * @param path Path to the file.
 * @return File content or error message.
 */
std::expected<std::string, std::string> read_file(const std::filesystem::path& path);

/**
 * @brief List candidate source files under a directory, recursively, in sorted order.
 *
 * @param dir Directory to walk.
 * @param extension Extension to keep, compared case-insensitively.
 * @return Candidate paths or error message.
 */
std::expected<std::vector<std::filesystem::path>, std::string> list_candidates(const std::filesystem::path& dir,
                                                                              const std::string& extension);

/**
 * @brief Build a function record from a file's content.
 *
 * @param path Path of the file, its stem becomes the function name.
 * @param content Content of the file.
 * @param options Scan options.
 * @param diagnostics Sink for malformed annotations.
 * @return The function record.
 */
FunctionRecord make_function_record(const std::filesystem::path& path, const std::string& content,
                                    const ScanOptions& options, DiagnosticSink& diagnostics);

}  // namespace detail

}  // namespace modsync::frontend
