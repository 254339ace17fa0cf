#pragma once

#include "codegen/options.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace modsync
{
/**
 * @brief Command line options
 */
struct Options {
    std::string root = ".";                       ///< base directory holding the module folders
    std::vector<std::string> modules;             ///< modules to regenerate
    bool all = false;                             ///< if true, regenerate every module under root
    bool check_only = false;                      ///< if true, compare only and never write
    bool print_manifest = false;                  ///< if true, print the export manifests as JSON
    bool crlf = false;                            ///< if true, write the loader script with CRLF line endings
    bool verbose = false;                         ///< if true, log per-file details
    std::string extension = ".ps1";               ///< function source extension
    std::string wip_suffix = "-wip";              ///< stem suffix of work-in-progress files
    std::string public_dir = "Public";            ///< exported functions directory
    std::string private_dir = "Private";          ///< helper functions directory
    std::optional<std::string> bump;              ///< if specified, bump ModuleVersion (major, minor, patch)
    std::optional<std::string> loader_template;   ///< if specified, replaces the built-in loader skeleton
    std::optional<std::string> help_message;      ///< if specified, show help message
};

/**
 * @brief Parse command line options
 *
 * Options given with --config FILE are read from an INI-style file; values on the
 * command line take precedence over the file.
 *
 * @param argc Number of command line arguments
 * @param argv Command line arguments
 * @return Parsed options or error message
 */
std::expected<Options, std::string> parse_command_line(int argc, char* argv[]);

/**
 * @brief Turn parsed options into the configuration of a regeneration run
 *
 * @param opts Parsed options
 * @return Generation options or error message
 */
std::expected<codegen::GenerationOptions, std::string> make_generation_options(const Options& opts);

}  // namespace modsync
