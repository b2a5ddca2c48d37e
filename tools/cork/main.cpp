/**
 * cork CLI - Entry Point
 *
 * Installs Windows applications into Bottles environments.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace cork::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_classify(CLI::App* app, GlobalOptions& opts);
    void setup_analyze(CLI::App* app, GlobalOptions& opts);
    void setup_shortcuts(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cork::cli;

    CLI::App app{"cork - install Windows applications into Bottles environments"};
    app.set_version_flag("-V,--version", CORK_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (cork.config.v1)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install an executable, disk image or folder");
    commands::setup_install(install_cmd, opts);

    auto* classify_cmd = app.add_subcommand("classify", "Show how a path would be installed");
    commands::setup_classify(classify_cmd, opts);

    auto* analyze_cmd = app.add_subcommand("analyze", "List the runtime components a binary needs");
    commands::setup_analyze(analyze_cmd, opts);

    auto* shortcuts_cmd = app.add_subcommand("shortcuts", "List or look up shortcuts of a bottle");
    commands::setup_shortcuts(shortcuts_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
