#pragma once

#include "cork/types.hpp"

#include <memory>

namespace cork {

class Installer;

// ============================================================================
// Target Classification
// ============================================================================

/**
 * Classify a request from the live filesystem.
 *
 *   1. missing path            -> Invalid ("path not found")
 *   2. directory               -> Folder
 *   3. .exe / .msi             -> Executable
 *      .iso                    -> DiskImage
 *   4. anything else           -> Invalid ("unrecognized file type")
 *
 * declared_kind and strategy_hint never change the result; a conflicting
 * hint is noted in the reason.
 */
TargetClassification classify_target(const InstallRequest& request);

/// Extension-only mapping, lowercased comparison. Invalid for unknown types.
TargetKind kind_for_extension(const std::string& path);

// ============================================================================
// Strategy Router
// ============================================================================

/// Picks the installer for a classification; never owns the installers
class StrategyRouter {
public:
    StrategyRouter(std::shared_ptr<Installer> file_installer, std::shared_ptr<Installer> folder_installer);

    TargetClassification classify(const InstallRequest& request) const { return classify_target(request); }

    /// nullptr for Invalid targets
    std::shared_ptr<Installer> select(const TargetClassification& classification) const;

private:
    std::shared_ptr<Installer> file_installer_;
    std::shared_ptr<Installer> folder_installer_;
};

} // namespace cork
