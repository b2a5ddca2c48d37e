#pragma once

#include "cork/config.hpp"
#include "cork/dependency_resolver.hpp"
#include "cork/environment_gateway.hpp"
#include "cork/lease_table.hpp"
#include "cork/shortcut_manager.hpp"
#include "cork/types.hpp"

#include <memory>
#include <string>

namespace cork {

// ============================================================================
// Installer Interface
// ============================================================================

/// Collaborators shared by both installers
struct InstallerServices {
    std::shared_ptr<EnvironmentGateway> gateway;
    std::shared_ptr<const DependencyResolver> resolver;
    std::shared_ptr<ShortcutManager> shortcuts;
    CorkConfig config;
};

/// Everything one run needs; the caller already holds the bottle's lease
struct InstallContext {
    InstallRequest request;
    TargetClassification classification;
    std::string bottle_name;
    CancellationToken cancel;
};

/**
 * Base for the file and folder state machines.
 *
 * run() drives the machine to Done or Failed. Before every transition it
 * checks the cancellation token; a cancelled run fails at the stage it was
 * about to enter. Nothing is rolled back on failure.
 */
class Installer {
public:
    explicit Installer(InstallerServices services) : services_(std::move(services)) {}
    virtual ~Installer() = default;

    virtual InstallOutcome run(const InstallContext& ctx) = 0;

    virtual const char* name() const = 0;

protected:
    // ------------------------------------------------------------------------
    // Shared steps
    // ------------------------------------------------------------------------

    Result<EnvironmentInfo> prepareEnvironment(const InstallContext& ctx);

    /// Scan `binary`, record the report on the outcome, install what it needs
    Result<void> resolveDependencies(const InstallContext& ctx, const std::string& binary,
                                     bool fresh_environment, InstallOutcome& outcome);

    Result<int> execute(const InstallContext& ctx, const std::string& binary);

    // ------------------------------------------------------------------------
    // Trace helpers
    // ------------------------------------------------------------------------

    InstallOutcome begin(const InstallContext& ctx) const;

    void enter(const InstallContext& ctx, InstallOutcome& outcome, const char* state) const;

    void fail(const InstallContext& ctx, InstallOutcome& outcome, Error error) const;

    /// Fails the outcome at `next_stage` when a cancel was requested
    bool checkpoint(const InstallContext& ctx, InstallOutcome& outcome, const char* next_stage) const;

    InstallerServices services_;
};

} // namespace cork
