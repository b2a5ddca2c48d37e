/**
 * cork CLI - Common utilities and types
 */

#pragma once

#include <cork/bottles_gateway.hpp>
#include <cork/config.hpp>
#include <cork/json.hpp>
#include <cork/orchestrator.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace cork::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Log to stderr so --json output stays clean.
 * -v enables debug, -q limits output to warnings and errors.
 */
inline void setup_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("cork");
    if (!logger) {
        logger = spdlog::stderr_color_mt("cork");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const { return nlohmann::json(warnings); }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Resolve the configuration.
 * Priority: --config flag > CORK_CONFIG env > defaults for the detected manager
 */
inline ConfigParseResult resolve_config(const GlobalOptions& opts) {
    auto result = load_config(opts.config, detect_manager());
    if (result.ok) {
        for (const auto& w : result.warnings) {
            get_warning_collector().add(w);
        }
        spdlog::debug("manager: {}, prefixes: {}", manager_kind_to_string(result.config.manager),
                      result.config.prefix_base);
    }
    return result;
}

/**
 * Build an orchestrator on the Bottles gateway, reporting failures.
 * Returns nullptr after printing the error.
 */
inline std::unique_ptr<Orchestrator> make_orchestrator(const GlobalOptions& opts) {
    auto config = resolve_config(opts);
    if (!config.ok) {
        print_error("config: " + config.error, opts.json);
        return nullptr;
    }

    auto gateway = std::make_shared<BottlesGateway>(config.config);
    auto created = Orchestrator::create(config.config, gateway);
    if (created.isErr()) {
        print_error(created.error().toString(), opts.json);
        return nullptr;
    }
    return std::move(created.value());
}

} // namespace cork::cli
