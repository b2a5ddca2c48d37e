#pragma once

#include "cork/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cork {

// ============================================================================
// Dependency Catalog
// ============================================================================

/**
 * Maps library names (case-insensitive) to runtime components and declares
 * the fixed order in which components are installed.
 *
 * The catalog is append-only: once a library is mapped its mapping never
 * changes, and extensions can only add new libraries.
 */
class DependencyCatalog {
public:
    DependencyCatalog() = default;

    /// The catalog shipped with cork
    static DependencyCatalog builtin();

    /// Bumped whenever builtin() gains entries
    int version() const { return version_; }
    void setVersion(int version) { version_ = version; }

    /// Returns false when the library is already mapped (existing mapping kept)
    bool add(const std::string& library, const std::string& component,
             ComponentSource source = ComponentSource::MustInstall);

    std::optional<RuntimeComponent> lookup(const std::string& library) const;

    /// Append components to the declared install order (duplicates ignored)
    void declareOrder(const std::vector<std::string>& components);

    /// Sort components by declared order; undeclared ones follow, alphabetically
    void sortByInstallOrder(std::vector<RuntimeComponent>& components) const;

    size_t size() const { return map_.size(); }

private:
    size_t rank(const std::string& component) const;

    int version_ = 0;
    std::unordered_map<std::string, RuntimeComponent> map_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, size_t> order_index_;
};

// ============================================================================
// Catalog Extensions
// ============================================================================

struct CatalogExtensionResult {
    bool ok = false;
    std::string error;
    size_t added = 0;
    std::vector<std::string> warnings;
};

/**
 * Append entries from a JSON document:
 *
 *   {
 *     "$schema": "cork.catalog.v1",
 *     "libraries": { "foo.dll": "foo", "bar.dll": { "component": "bar", "provided_by": "base" } },
 *     "install_order": ["foo", "bar"]
 *   }
 */
CatalogExtensionResult extend_catalog(DependencyCatalog& catalog, const std::string& json_str);

} // namespace cork
