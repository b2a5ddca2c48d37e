#pragma once

#include "cork/result.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Request Kinds
// ============================================================================

/// What the caller believes the target is. Advisory only.
enum class DeclaredKind {
    File,
    Folder,
    Unknown
};

enum class StrategyHint {
    Executable,
    DiskImage,
    Folder
};

/// What the target actually is, derived from the live filesystem.
enum class TargetKind {
    Executable,
    DiskImage,
    Folder,
    Invalid
};

inline const char* declared_kind_to_string(DeclaredKind k) {
    switch (k) {
        case DeclaredKind::File: return "file";
        case DeclaredKind::Folder: return "folder";
        case DeclaredKind::Unknown: return "unknown";
        default: return "unknown";
    }
}

inline const char* strategy_hint_to_string(StrategyHint h) {
    switch (h) {
        case StrategyHint::Executable: return "exe";
        case StrategyHint::DiskImage: return "iso";
        case StrategyHint::Folder: return "folder";
        default: return "exe";
    }
}

inline const char* target_kind_to_string(TargetKind k) {
    switch (k) {
        case TargetKind::Executable: return "Executable";
        case TargetKind::DiskImage: return "DiskImage";
        case TargetKind::Folder: return "Folder";
        case TargetKind::Invalid: return "Invalid";
        default: return "Invalid";
    }
}

// Case-insensitive parsers
std::optional<DeclaredKind> parse_declared_kind(const std::string& s);
std::optional<StrategyHint> parse_strategy_hint(const std::string& s);

// ============================================================================
// Install Request
// ============================================================================

struct InstallRequest {
    std::string target_path;
    DeclaredKind declared_kind = DeclaredKind::Unknown;
    std::optional<std::string> bottle_name;
    std::optional<StrategyHint> strategy_hint;
    std::optional<std::string> target_subdir;  // folder installs: drive_c/<subdir>
};

struct TargetClassification {
    TargetKind kind = TargetKind::Invalid;
    std::string reason;
};

// ============================================================================
// Runtime Components
// ============================================================================

enum class ComponentSource {
    BaseRuntime,  // Shipped by the compatibility layer; never installed
    MustInstall
};

inline const char* component_source_to_string(ComponentSource s) {
    switch (s) {
        case ComponentSource::BaseRuntime: return "BaseRuntime";
        case ComponentSource::MustInstall: return "MustInstall";
        default: return "MustInstall";
    }
}

struct RuntimeComponent {
    std::string id;
    ComponentSource provided_by = ComponentSource::MustInstall;

    bool operator==(const RuntimeComponent& other) const {
        return id == other.id && provided_by == other.provided_by;
    }
    bool operator!=(const RuntimeComponent& other) const { return !(*this == other); }
};

/**
 * Result of scanning one binary. Import names are stored lowercased.
 * resolved_components is in install order.
 */
struct DependencyReport {
    std::string binary_path;
    std::set<std::string> detected_imports;
    std::vector<RuntimeComponent> resolved_components;
    std::set<std::string> unresolved_imports;
    std::vector<std::string> warnings;
};

// ============================================================================
// Shortcuts
// ============================================================================

enum class ShortcutSource {
    EnvironmentNative,
    ManualRecord
};

inline const char* shortcut_source_to_string(ShortcutSource s) {
    switch (s) {
        case ShortcutSource::EnvironmentNative: return "EnvironmentNative";
        case ShortcutSource::ManualRecord: return "ManualRecord";
        default: return "ManualRecord";
    }
}

struct ShortcutEntry {
    std::string bottle_name;
    std::string display_name;
    std::string target_executable_path;
    ShortcutSource source = ShortcutSource::ManualRecord;
};

// ============================================================================
// Install Outcome
// ============================================================================

enum class InstallStatus {
    Succeeded,
    Failed
};

struct InstallOutcome {
    InstallStatus status = InstallStatus::Failed;
    std::optional<ShortcutEntry> shortcut;
    std::optional<InstallError> error;

    std::string bottle_name;
    TargetKind kind = TargetKind::Invalid;
    std::vector<std::string> states;  // State names visited, in order
    std::optional<DependencyReport> dependencies;

    bool succeeded() const { return status == InstallStatus::Succeeded; }
};

} // namespace cork
