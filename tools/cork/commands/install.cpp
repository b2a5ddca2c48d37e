/**
 * cork CLI - install command
 *
 * Install an executable, disk image or application folder into a bottle.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cork::cli::commands {

namespace {

struct InstallOptions {
    std::string path;
    std::string bottle;
    std::string kind;
    std::string hint;
    std::string subdir;
};

void print_outcome(const InstallOutcome& outcome) {
    if (outcome.succeeded()) {
        std::cout << "Installed into bottle '" << outcome.bottle_name << "' ("
                  << target_kind_to_string(outcome.kind) << ")" << std::endl;
        if (outcome.shortcut) {
            std::cout << "Shortcut: " << outcome.shortcut->display_name << " -> "
                      << outcome.shortcut->target_executable_path << " ["
                      << shortcut_source_to_string(outcome.shortcut->source) << "]" << std::endl;
        }
    } else if (outcome.error) {
        std::cerr << "Error: " << error_code_to_string(outcome.error->code()) << " at "
                  << outcome.error->stage() << ": " << outcome.error->message() << std::endl;
    }

    if (outcome.dependencies) {
        const auto& deps = *outcome.dependencies;
        if (!deps.resolved_components.empty()) {
            std::cout << "Components:";
            for (const auto& c : deps.resolved_components) {
                if (c.provided_by == ComponentSource::MustInstall) std::cout << " " << c.id;
            }
            std::cout << std::endl;
        }
        if (!deps.unresolved_imports.empty()) {
            std::cout << "Unmapped imports:";
            for (const auto& lib : deps.unresolved_imports) std::cout << " " << lib;
            std::cout << std::endl;
        }
    }
}

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    setup_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    InstallRequest request;
    request.target_path = install_opts.path;

    if (!install_opts.kind.empty()) {
        auto kind = parse_declared_kind(install_opts.kind);
        if (!kind) {
            print_error("invalid --kind: " + install_opts.kind, opts.json);
            return 1;
        }
        request.declared_kind = *kind;
    }
    if (!install_opts.hint.empty()) {
        auto hint = parse_strategy_hint(install_opts.hint);
        if (!hint) {
            print_error("invalid --hint: " + install_opts.hint, opts.json);
            return 1;
        }
        request.strategy_hint = *hint;
    }
    if (!install_opts.bottle.empty()) request.bottle_name = install_opts.bottle;
    if (!install_opts.subdir.empty()) request.target_subdir = install_opts.subdir;

    auto orchestrator = make_orchestrator(opts);
    if (!orchestrator) return 1;

    InstallOutcome outcome = orchestrator->install(request);

    if (opts.json) {
        output_json(to_json(outcome));
    } else {
        print_outcome(outcome);
    }
    return outcome.succeeded() ? 0 : 1;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("path", install_opts.path, "Executable, .iso image or folder")->required();
    app->add_option("-b,--bottle", install_opts.bottle, "Bottle name (default: derived from path)");
    app->add_option("--kind", install_opts.kind, "What the path is believed to be (file|folder)");
    app->add_option("--hint", install_opts.hint, "Strategy hint (exe|iso|folder)");
    app->add_option("--subdir", install_opts.subdir, "Folder installs: directory under drive_c");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace cork::cli::commands
