/**
 * cork CLI - shortcuts command
 *
 * List a bottle's shortcuts from both the native registry and the sidecar.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cork::cli::commands {

namespace {

struct ShortcutsOptions {
    std::string bottle;
    std::string name;
};

int cmd_shortcuts(const GlobalOptions& opts, const ShortcutsOptions& shortcut_opts) {
    setup_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto orchestrator = make_orchestrator(opts);
    if (!orchestrator) return 1;

    std::vector<ShortcutEntry> entries;
    if (!shortcut_opts.name.empty()) {
        auto found = orchestrator->findShortcut(shortcut_opts.bottle, shortcut_opts.name);
        if (!found) {
            print_error("No shortcut '" + shortcut_opts.name + "' in bottle " + shortcut_opts.bottle, opts.json);
            return 1;
        }
        entries.push_back(*found);
    } else {
        entries = orchestrator->listShortcuts(shortcut_opts.bottle);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["bottle"] = shortcut_opts.bottle;
        nlohmann::json list = nlohmann::json::array();
        for (const auto& e : entries) list.push_back(to_json(e));
        j["shortcuts"] = list;
        output_json(j);
        return 0;
    }

    if (entries.empty()) {
        std::cout << "No shortcuts in bottle " << shortcut_opts.bottle << std::endl;
        return 0;
    }
    for (const auto& e : entries) {
        std::cout << e.display_name << "  " << e.target_executable_path << "  ["
                  << shortcut_source_to_string(e.source) << "]" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_shortcuts(CLI::App* app, GlobalOptions& opts) {
    static ShortcutsOptions shortcut_opts;

    app->add_option("bottle", shortcut_opts.bottle, "Bottle name")->required();
    app->add_option("-n,--name", shortcut_opts.name, "Look up one display name");

    app->callback([&opts]() {
        std::exit(cmd_shortcuts(opts, shortcut_opts));
    });
}

} // namespace cork::cli::commands
