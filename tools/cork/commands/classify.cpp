/**
 * cork CLI - classify command
 *
 * Show which installer a path would be routed to, without installing.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cork::cli::commands {

namespace {

struct ClassifyOptions {
    std::string path;
    std::string kind;
};

int cmd_classify(const GlobalOptions& opts, const ClassifyOptions& classify_opts) {
    setup_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    InstallRequest request;
    request.target_path = classify_opts.path;
    if (!classify_opts.kind.empty()) {
        auto kind = parse_declared_kind(classify_opts.kind);
        if (!kind) {
            print_error("invalid --kind: " + classify_opts.kind, opts.json);
            return 1;
        }
        request.declared_kind = *kind;
    }

    TargetClassification result = classify_target(request);
    bool valid = result.kind != TargetKind::Invalid;

    if (opts.json) {
        nlohmann::json j = to_json(result);
        j["ok"] = valid;
        j["path"] = classify_opts.path;
        if (valid) j["bottle"] = derive_bottle_name(classify_opts.path);
        output_json(j);
    } else {
        std::cout << target_kind_to_string(result.kind) << ": " << result.reason << std::endl;
        if (valid) {
            std::cout << "Default bottle: " << derive_bottle_name(classify_opts.path) << std::endl;
        }
    }
    return valid ? 0 : 1;
}

} // anonymous namespace

void setup_classify(CLI::App* app, GlobalOptions& opts) {
    static ClassifyOptions classify_opts;

    app->add_option("path", classify_opts.path, "Path to classify")->required();
    app->add_option("--kind", classify_opts.kind, "Declared kind (file|folder)");

    app->callback([&opts]() {
        std::exit(cmd_classify(opts, classify_opts));
    });
}

} // namespace cork::cli::commands
