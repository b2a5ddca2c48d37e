#pragma once

#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Environment Manager Selection
// ============================================================================

enum class ManagerKind {
    Auto,
    Flatpak,
    Native
};

inline const char* manager_kind_to_string(ManagerKind k) {
    switch (k) {
        case ManagerKind::Auto: return "auto";
        case ManagerKind::Flatpak: return "flatpak";
        case ManagerKind::Native: return "native";
        default: return "auto";
    }
}

// ============================================================================
// Configuration
// ============================================================================

/// argv prefixes for every external tool the gateway invokes
struct ToolCommands {
    std::vector<std::string> bottles_cli;
    std::vector<std::string> wine;
    std::vector<std::string> winetricks;
    std::vector<std::string> wineserver;
    std::vector<std::string> extractor;
};

/// Timeouts in seconds
struct Timeouts {
    int default_seconds = 300;
    int component_install = 600;
    int run_binary = 1800;
    int wineserver_wait = 60;
};

struct ShortcutPoll {
    int window_ms = 5000;
    int interval_ms = 500;
};

/**
 * Immutable settings built once at startup and handed to every component.
 */
struct CorkConfig {
    std::string schema = "cork.config.v1";
    std::string source_path;

    ManagerKind manager = ManagerKind::Auto;
    std::string prefix_base;
    std::string staging_dir;
    std::string shortcuts_dir;
    std::string environment_template = "gaming";

    ToolCommands commands;
    Timeouts timeouts;
    ShortcutPoll shortcut_poll;

    std::vector<std::string> baseline_components = {"d3dx9", "dxvk", "vcrun2019"};
    std::string catalog_extensions;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    CorkConfig config;
    std::vector<std::string> warnings;
};

/// Defaults for a concrete manager (Auto is treated as Native)
CorkConfig default_config(ManagerKind manager = ManagerKind::Native);

/// Tool commands used with a given manager
ToolCommands default_commands(ManagerKind manager);

/// Parse a cork.config.v1 document; fields not present keep their defaults
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "",
                               ManagerKind detected = ManagerKind::Native);

/**
 * Resolve the effective configuration:
 *   explicit_path > $CORK_CONFIG > built-in defaults.
 *
 * `detected` is the manager used when the file leaves `manager` as auto.
 */
ConfigParseResult load_config(const std::string& explicit_path, ManagerKind detected);

/// Probe for the flatpak build of Bottles, falling back to native tools
ManagerKind detect_manager();

} // namespace cork
