#include "cork/config.hpp"
#include "cork/platform.hpp"
#include "cork/process.hpp"

#include <limits>
#include <optional>

#include <nlohmann/json.hpp>

namespace cork {

namespace {

constexpr const char* FLATPAK_APP_ID = "com.usebottles.bottles";

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::optional<std::vector<std::string>> get_string_array(const nlohmann::json& j,
                                                         const std::string& key) {
    if (!j.contains(key) || !j[key].is_array()) return std::nullopt;

    std::vector<std::string> result;
    for (const auto& elem : j[key]) {
        if (elem.is_string()) {
            result.push_back(elem.get<std::string>());
        }
    }
    return result;
}

// Integer field in [1, INT_MAX]; anything else leaves `out` untouched and warns
void read_positive_int(const nlohmann::json& j, const std::string& key, int& out,
                       const std::string& warning_prefix, std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    constexpr long long max_value = std::numeric_limits<int>::max();

    long long n = 0;
    if (v.is_number_unsigned()) {
        auto u = v.get<unsigned long long>();
        n = u > static_cast<unsigned long long>(max_value) ? max_value + 1 : static_cast<long long>(u);
    } else if (v.is_number_integer()) {
        n = v.get<long long>();
    }

    if (n > 0 && n <= max_value) {
        out = static_cast<int>(n);
    } else {
        warnings.push_back("invalid_configuration:" + warning_prefix + key);
    }
}

// "~/x" -> "$HOME/x"
std::string expand_home(const std::string& path) {
    if (path == "~") return home_directory();
    if (path.rfind("~/", 0) == 0) return home_directory() + path.substr(1);
    return path;
}

std::optional<ManagerKind> parse_manager_kind(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "auto") return ManagerKind::Auto;
    if (v == "flatpak") return ManagerKind::Flatpak;
    if (v == "native") return ManagerKind::Native;
    return std::nullopt;
}

std::vector<std::string> flatpak_command(const std::string& tool) {
    return {"flatpak", "run", "--command=" + tool, FLATPAK_APP_ID};
}

std::string default_prefix_base(ManagerKind manager) {
    if (manager == ManagerKind::Flatpak) {
        return home_directory() + "/.var/app/com.usebottles.bottles/data/bottles/bottles";
    }
    return home_directory() + "/.local/share/bottles/bottles";
}

const char* const KNOWN_KEYS[] = {
    "$schema",  "manager",  "prefix_base",   "staging_dir",         "shortcuts_dir",
    "commands", "timeouts", "shortcut_poll", "environment_template", "baseline_components",
    "catalog_extensions",
};

bool is_known_key(const std::string& key) {
    for (const char* known : KNOWN_KEYS) {
        if (key == known) return true;
    }
    return false;
}

} // namespace

ToolCommands default_commands(ManagerKind manager) {
    ToolCommands commands;
    if (manager == ManagerKind::Flatpak) {
        commands.bottles_cli = flatpak_command("bottles-cli");
        commands.wine = flatpak_command("wine");
        commands.winetricks = flatpak_command("winetricks");
        commands.wineserver = flatpak_command("wineserver");
    } else {
        commands.bottles_cli = {"bottles-cli"};
        commands.wine = {"wine"};
        commands.winetricks = {"winetricks"};
        commands.wineserver = {"wineserver"};
    }
    // Images are extracted on the host in both cases
    commands.extractor = {"7z"};
    return commands;
}

CorkConfig default_config(ManagerKind manager) {
    if (manager == ManagerKind::Auto) manager = ManagerKind::Native;

    CorkConfig config;
    config.manager = manager;
    config.prefix_base = default_prefix_base(manager);
    config.staging_dir = home_directory() + "/.cache/cork/staging";
    config.shortcuts_dir = home_directory() + "/.local/share/cork/shortcuts";
    config.commands = default_commands(manager);
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path,
                               ManagerKind detected) {
    ConfigParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        auto schema = get_string(j, "$schema");
        if (!schema) {
            result.error = "$schema missing";
            return result;
        }
        if (trim(*schema) != "cork.config.v1") {
            result.error = "$schema mismatch: expected cork.config.v1";
            return result;
        }

        for (auto& [key, val] : j.items()) {
            (void)val;
            if (!is_known_key(key)) {
                result.warnings.push_back("unknown_key:" + key);
            }
        }

        // The manager decides every path and command default below
        ManagerKind manager = detected;
        if (auto m = get_string(j, "manager")) {
            auto parsed = parse_manager_kind(*m);
            if (!parsed) {
                result.warnings.push_back("invalid_configuration:invalid_manager");
            } else if (*parsed != ManagerKind::Auto) {
                manager = *parsed;
            }
        }

        CorkConfig config = default_config(manager);
        config.source_path = source_path;

        if (auto v = get_string(j, "prefix_base")) config.prefix_base = expand_home(*v);
        if (auto v = get_string(j, "staging_dir")) config.staging_dir = expand_home(*v);
        if (auto v = get_string(j, "shortcuts_dir")) config.shortcuts_dir = expand_home(*v);
        if (auto v = get_string(j, "environment_template")) config.environment_template = *v;
        if (auto v = get_string(j, "catalog_extensions")) config.catalog_extensions = expand_home(*v);

        if (auto v = get_string_array(j, "baseline_components")) {
            config.baseline_components = *v;
        }

        // "commands" section
        if (j.contains("commands") && j["commands"].is_object()) {
            const auto& cmds = j["commands"];
            struct Slot {
                const char* key;
                std::vector<std::string>* target;
            };
            const Slot slots[] = {
                {"bottles_cli", &config.commands.bottles_cli},
                {"wine", &config.commands.wine},
                {"winetricks", &config.commands.winetricks},
                {"wineserver", &config.commands.wineserver},
                {"extractor", &config.commands.extractor},
            };
            for (const auto& slot : slots) {
                auto argv = get_string_array(cmds, slot.key);
                if (!argv) continue;
                if (argv->empty()) {
                    result.warnings.push_back(std::string("invalid_configuration:empty_command:") + slot.key);
                    continue;
                }
                *slot.target = *argv;
            }
        }

        // "timeouts" section
        if (j.contains("timeouts") && j["timeouts"].is_object()) {
            const auto& t = j["timeouts"];
            read_positive_int(t, "default", config.timeouts.default_seconds, "timeouts.", result.warnings);
            read_positive_int(t, "component_install", config.timeouts.component_install, "timeouts.",
                              result.warnings);
            read_positive_int(t, "run_binary", config.timeouts.run_binary, "timeouts.", result.warnings);
            read_positive_int(t, "wineserver_wait", config.timeouts.wineserver_wait, "timeouts.",
                              result.warnings);
        }

        // "shortcut_poll" section
        if (j.contains("shortcut_poll") && j["shortcut_poll"].is_object()) {
            const auto& p = j["shortcut_poll"];
            read_positive_int(p, "window_ms", config.shortcut_poll.window_ms, "shortcut_poll.",
                              result.warnings);
            read_positive_int(p, "interval_ms", config.shortcut_poll.interval_ms, "shortcut_poll.",
                              result.warnings);
        }

        result.config = std::move(config);
        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config(const std::string& explicit_path, ManagerKind detected) {
    std::string path = explicit_path;
    if (path.empty()) {
        path = get_env("CORK_CONFIG").value_or("");
    }

    if (path.empty()) {
        ConfigParseResult result;
        result.config = default_config(detected);
        result.ok = true;
        return result;
    }

    auto content = read_file(path);
    if (!content) {
        ConfigParseResult result;
        result.error = "failed to read config file: " + path;
        return result;
    }

    return parse_config(*content, path, detected);
}

ManagerKind detect_manager() {
    ProcessSpec spec;
    spec.argv = {"flatpak", "list", "--app", "--columns=application"};
    spec.timeout = std::chrono::seconds(15);

    auto result = run_process(spec);
    if (result.ok && !result.timed_out && result.exit_code == 0 &&
        result.output.find(FLATPAK_APP_ID) != std::string::npos) {
        return ManagerKind::Flatpak;
    }
    return ManagerKind::Native;
}

} // namespace cork
