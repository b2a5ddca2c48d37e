#pragma once

/**
 * @file orchestrator.hpp
 * @brief Entry point for installing Windows applications into environments
 *
 * @example
 * ```cpp
 * #include <cork/orchestrator.hpp>
 *
 * auto config = cork::default_config(cork::detect_manager());
 * auto gateway = std::make_shared<cork::BottlesGateway>(config);
 * auto orchestrator = cork::Orchestrator::create(config, gateway);
 * if (orchestrator.isOk()) {
 *     cork::InstallRequest request;
 *     request.target_path = "/data/Game/setup.exe";
 *     auto outcome = orchestrator.value()->install(request);
 * }
 * ```
 */

#include "cork/config.hpp"
#include "cork/dependency_resolver.hpp"
#include "cork/environment_gateway.hpp"
#include "cork/lease_table.hpp"
#include "cork/router.hpp"
#include "cork/shortcut_manager.hpp"
#include "cork/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Bottle Names
// ============================================================================

/// 2-32 of [A-Za-z0-9_-. '] with at least one letter or digit
bool is_valid_bottle_name(const std::string& name);

/// Name derived from a target path (file stem or folder name)
std::string derive_bottle_name(const std::string& target_path);

// ============================================================================
// Orchestrator
// ============================================================================

/**
 * @brief Sequences router, installers and shortcut bookkeeping
 *
 * install() may be called from any number of threads. Requests for the same
 * bottle run one at a time in arrival order; requests for different bottles
 * run concurrently.
 */
class Orchestrator {
public:
    /**
     * @brief Build the catalog and every component from the configuration
     * @return Error with CONFIG_ERROR when catalog extensions cannot be loaded
     */
    static Result<std::unique_ptr<Orchestrator>> create(CorkConfig config,
                                                        std::shared_ptr<EnvironmentGateway> gateway);

    InstallOutcome install(const InstallRequest& request, CancellationToken cancel = CancellationToken());

    /// Dependency report for a binary without touching any environment
    DependencyReport analyze(const std::string& binary_path) const;

    TargetClassification classify(const InstallRequest& request) const;

    std::optional<ShortcutEntry> findShortcut(const std::string& bottle_name,
                                              const std::string& display_name) const;

    std::vector<ShortcutEntry> listShortcuts(const std::string& bottle_name) const;

    const CorkConfig& config() const { return config_; }
    const DependencyCatalog& catalog() const { return *catalog_; }
    LeaseTable& leases() { return leases_; }

private:
    Orchestrator(CorkConfig config, std::shared_ptr<EnvironmentGateway> gateway,
                 std::shared_ptr<const DependencyCatalog> catalog);

    CorkConfig config_;
    std::shared_ptr<EnvironmentGateway> gateway_;
    std::shared_ptr<const DependencyCatalog> catalog_;
    std::shared_ptr<const DependencyResolver> resolver_;
    std::shared_ptr<ShortcutManager> shortcuts_;
    std::unique_ptr<StrategyRouter> router_;
    LeaseTable leases_;
};

} // namespace cork
