#pragma once

#include "cork/config.hpp"
#include "cork/environment_gateway.hpp"
#include "cork/process.hpp"

#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Bottles Gateway
// ============================================================================

/**
 * EnvironmentGateway backed by bottles-cli, winetricks, wineserver and 7z,
 * either installed natively or run through the Bottles flatpak.
 */
class BottlesGateway : public EnvironmentGateway {
public:
    explicit BottlesGateway(CorkConfig config);

    Result<EnvironmentInfo> ensureEnvironment(const std::string& name) override;
    Result<std::string> mountImage(const std::string& env, const std::string& image_path) override;
    Result<void> copyTree(const std::string& src, const std::string& dest) override;
    Result<void> installComponent(const std::string& env, const std::string& component_id) override;
    Result<int> runBinary(const std::string& env, const std::string& binary_path,
                          std::chrono::seconds timeout) override;
    Result<std::vector<ShortcutEntry>> listNativeShortcuts(const std::string& env) override;
    Result<void> createNativeShortcut(const std::string& env, const std::string& display_name,
                                      const std::string& binary_path) override;
    std::string storagePath(const std::string& env) const override;

    const CorkConfig& config() const { return config_; }

private:
    ProcessResult invoke(const std::vector<std::string>& prefix, const std::vector<std::string>& args,
                         std::chrono::seconds timeout, const std::string& env = "") const;

    /// Best-effort `wineboot --repair` on a freshly created prefix
    void repairPrefix(const std::string& env) const;

    /// Best-effort wait for the environment's wineserver to go idle
    void waitForWineserver(const std::string& env) const;

    CorkConfig config_;
};

/// First setup/install/autorun/start executable at depth <= 1, or empty
std::string find_image_installer(const std::string& root);

/// Parse `bottles-cli --json programs` output into shortcut entries
Result<std::vector<ShortcutEntry>> parse_program_list(const std::string& env, const std::string& output);

} // namespace cork
