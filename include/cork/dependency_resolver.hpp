#pragma once

#include "cork/dependency_catalog.hpp"
#include "cork/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Dependency Resolver
// ============================================================================

/**
 * Maps a binary's imported libraries to the runtime components it needs.
 *
 * Stateless apart from the shared, read-only catalog: safe to call from any
 * number of install tasks at once.
 */
class DependencyResolver {
public:
    explicit DependencyResolver(std::shared_ptr<const DependencyCatalog> catalog);

    /// Scan the binary's import tables. Unreadable binaries yield an empty
    /// report with a warning; they never fail.
    DependencyReport resolve(const std::string& binary_path) const;

    /// Resolve an already-extracted import list
    DependencyReport resolveImports(const std::string& binary_path,
                                    const std::vector<std::string>& imports) const;

    /// Components to install for a report plus any extra ids, MustInstall only,
    /// deduplicated and in install order.
    std::vector<RuntimeComponent> installPlan(const DependencyReport& report,
                                              const std::vector<std::string>& extra = {}) const;

    const DependencyCatalog& catalog() const { return *catalog_; }

private:
    std::shared_ptr<const DependencyCatalog> catalog_;
};

} // namespace cork
