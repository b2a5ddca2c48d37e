#pragma once

#include "cork/installer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// File Installer
// ============================================================================

/**
 * Single-file installers (executables and disk images).
 *
 *   Created -> EnvironmentReady -> Staged -> DependenciesResolved
 *           -> Executed -> ShortcutCreated -> Done
 *
 * The shortcut is always an EnvironmentNative entry: the one the environment
 * manager registered during the run if it shows up within the polling
 * window, otherwise one synthesized from the binary.
 */
class FileInstaller : public Installer {
public:
    using Installer::Installer;

    InstallOutcome run(const InstallContext& ctx) override;

    const char* name() const override { return "file"; }

private:
    enum class State {
        Created,
        EnvironmentReady,
        Staged,
        DependenciesResolved,
        Executed,
        ShortcutCreated,
        Done,
        Failed,
    };

    ShortcutEntry awaitShortcut(const InstallContext& ctx, const std::string& binary,
                                const std::vector<ShortcutEntry>& before);
};

/**
 * Pick the native entry created for `binary`: one whose target has the same
 * file name wins, otherwise the first entry absent from `before`.
 */
std::optional<ShortcutEntry> match_native_shortcut(const std::vector<ShortcutEntry>& now,
                                                   const std::vector<ShortcutEntry>& before,
                                                   const std::string& binary);

} // namespace cork
