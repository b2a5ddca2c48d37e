#pragma once

#include "cork/installer.hpp"

#include <string>

namespace cork {

// ============================================================================
// Folder Installer
// ============================================================================

/**
 * Pre-extracted application trees.
 *
 *   Created -> EnvironmentReady -> Copied -> ExecutableDiscovered
 *           -> DependenciesResolved -> Executed -> ShortcutRecorded -> Done
 *
 * The tree is copied to <prefix>/drive_c/<subdir>. The shortcut is always a
 * manual sidecar record.
 */
class FolderInstaller : public Installer {
public:
    using Installer::Installer;

    InstallOutcome run(const InstallContext& ctx) override;

    const char* name() const override { return "folder"; }

private:
    enum class State {
        Created,
        EnvironmentReady,
        Copied,
        ExecutableDiscovered,
        DependenciesResolved,
        Executed,
        ShortcutRecorded,
        Done,
        Failed,
    };
};

// ============================================================================
// Executable Discovery
// ============================================================================

/// Length of the longest common substring of a and b
size_t longest_common_substring(const std::string& a, const std::string& b);

/**
 * Choose the binary to launch from a copied tree.
 *
 * Candidates are *.exe files (any case) outside windows/system32/syswow64,
 * visited in lexicographic path order. Names that look like uninstallers,
 * updaters, crash reporters or redistributables are only used when nothing
 * else exists. Among the rest, the name sharing the longest common
 * substring with `hint` wins; ties keep the earlier path.
 */
Result<std::string> discover_launchable(const std::string& root, const std::string& hint);

/// Final component of a folder path, ignoring trailing separators
std::string folder_name(const std::string& path);

} // namespace cork
