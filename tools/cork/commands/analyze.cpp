/**
 * cork CLI - analyze command
 *
 * Dry run of the dependency scan for one binary.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cork::cli::commands {

namespace {

struct AnalyzeOptions {
    std::string binary;
};

int cmd_analyze(const GlobalOptions& opts, const AnalyzeOptions& analyze_opts) {
    setup_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto orchestrator = make_orchestrator(opts);
    if (!orchestrator) return 1;

    DependencyReport report = orchestrator->analyze(analyze_opts.binary);
    for (const auto& w : report.warnings) {
        get_warning_collector().add(w);
    }

    if (opts.json) {
        nlohmann::json j = to_json(report);
        j["ok"] = true;
        j["catalog_version"] = orchestrator->catalog().version();
        output_json(j);
        return 0;
    }

    std::cout << "Binary: " << report.binary_path << std::endl;
    std::cout << "Imports: " << report.detected_imports.size() << std::endl;

    std::cout << "Components to install:";
    bool any = false;
    for (const auto& c : report.resolved_components) {
        if (c.provided_by != ComponentSource::MustInstall) continue;
        std::cout << " " << c.id;
        any = true;
    }
    std::cout << (any ? "" : " (none)") << std::endl;

    if (!report.unresolved_imports.empty()) {
        std::cout << "Unmapped:";
        for (const auto& lib : report.unresolved_imports) std::cout << " " << lib;
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_analyze(CLI::App* app, GlobalOptions& opts) {
    static AnalyzeOptions analyze_opts;

    app->add_option("binary", analyze_opts.binary, "Windows executable or DLL")->required();

    app->callback([&opts]() {
        std::exit(cmd_analyze(opts, analyze_opts));
    });
}

} // namespace cork::cli::commands
