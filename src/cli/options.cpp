#include "cli/options.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <boost/program_options.hpp>

#include <fstream>

namespace modsync
{

std::expected<Options, std::string> parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    Options opts;
    std::string config_file;
    std::string bump_value;
    std::string loader_template_value;

    // clang-format off
    po::options_description generic("Options");
    generic.add_options()
        ("help,h", "Show help message")
        ("config", po::value<std::string>(&config_file)->value_name("FILE"),
            "Read options from an INI-style file. Command line values take precedence.");

    po::options_description config("Regeneration");
    config.add_options()
        ("root,r", po::value<std::string>(&opts.root)->value_name("DIR")->default_value("."),
            "Directory holding the module folders.")
        ("module,m", po::value<std::vector<std::string>>(&opts.modules)->value_name("NAME")->composing(),
            "Module to regenerate. May be repeated or given positionally.")
        ("all,A", po::bool_switch(&opts.all), "Regenerate every module found under the root directory")
        ("check-only,c", po::bool_switch(&opts.check_only), "Report stale files without writing them")
        ("print-manifest,p", po::bool_switch(&opts.print_manifest), "Print the export manifests as JSON")
        ("bump,b", po::value<std::string>(&bump_value)->value_name("LEVEL"),
            "Bump ModuleVersion in the manifest: major, minor or patch.")
        ("extension,e", po::value<std::string>(&opts.extension)->value_name("EXT")->default_value(".ps1"),
            "Extension of function source files.")
        ("wip-suffix,w", po::value<std::string>(&opts.wip_suffix)->value_name("SUFFIX")->default_value("-wip"),
            "File name suffix of work-in-progress functions, which are never exported.")
        ("public-dir", po::value<std::string>(&opts.public_dir)->value_name("NAME")->default_value("Public"),
            "Directory of exported functions inside a module.")
        ("private-dir", po::value<std::string>(&opts.private_dir)->value_name("NAME")->default_value("Private"),
            "Directory of helper functions inside a module.")
        ("loader-template", po::value<std::string>(&loader_template_value)->value_name("FILE"),
            "Replacement skeleton for the loader script.")
        ("crlf", po::bool_switch(&opts.crlf), "Write the loader script with CRLF line endings")
        ("verbose,v", po::bool_switch(&opts.verbose), "Log per-file details");
    // clang-format on

    po::options_description cmdline;
    cmdline.add(generic).add(config);

    po::positional_options_description positional;
    positional.add("module", -1);

    po::variables_map vm;

    try {
        auto parser = po::command_line_parser(argc, argv).options(cmdline).positional(positional).run();
        po::store(parser, vm);

        if (vm.count("help")) {
            // if help is specified, return the options object with help set, ignore other options
            std::string prog_name = argc > 0 ? argv[0] : "modsync";
            opts.help_message =
                fmt::format("Usage: {} [Options] [MODULE...]:\n{}\n", prog_name, fmt::streamed(cmdline));
            return opts;
        }

        if (vm.count("config")) {
            const auto path = vm["config"].as<std::string>();
            std::ifstream in(path);
            if (!in) {
                return std::unexpected("cannot open config file '" + path + "'");
            }
            po::store(po::parse_config_file(in, config), vm);
        }

        po::notify(vm);
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }

    if (opts.all && !opts.modules.empty()) {
        return std::unexpected("module names cannot be combined with '--all'");
    }
    if (!opts.all && opts.modules.empty()) {
        return std::unexpected("no module specified: pass module names or '--all'");
    }

    if (!bump_value.empty()) {
        opts.bump = std::move(bump_value);
    }
    if (!loader_template_value.empty()) {
        opts.loader_template = std::move(loader_template_value);
    }
    return opts;
}

std::expected<codegen::GenerationOptions, std::string> make_generation_options(const Options& opts)
{
    codegen::GenerationOptions generation;
    generation.layout.public_dir = opts.public_dir;
    generation.layout.private_dir = opts.private_dir;
    generation.scan.extension = opts.extension;
    generation.scan.wip_suffix = opts.wip_suffix;
    generation.write.check_only = opts.check_only;
    generation.write.crlf = opts.crlf;

    if (!generation.scan.extension.empty() && generation.scan.extension.front() != '.') {
        generation.scan.extension.insert(generation.scan.extension.begin(), '.');
    }

    if (opts.loader_template) {
        generation.loader_template = *opts.loader_template;
    }

    if (opts.bump) {
        auto level = codegen::parse_bump_level(*opts.bump);
        if (!level) {
            return std::unexpected(level.error());
        }
        generation.bump = level.value();
    }

    return generation;
}

}  // namespace modsync
