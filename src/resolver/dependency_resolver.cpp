#include "cork/dependency_resolver.hpp"
#include "cork/pe_imports.hpp"
#include "cork/platform.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace cork {

DependencyResolver::DependencyResolver(std::shared_ptr<const DependencyCatalog> catalog)
    : catalog_(std::move(catalog)) {}

DependencyReport DependencyResolver::resolve(const std::string& binary_path) const {
    auto scan = read_pe_imports(binary_path);
    if (!scan.ok) {
        spdlog::warn("Import scan of {} failed: {}", binary_path, scan.error);
        DependencyReport report = resolveImports(binary_path, {});
        report.warnings.push_back("import_scan_failed:" + scan.error);
        return report;
    }
    return resolveImports(binary_path, scan.imports);
}

DependencyReport DependencyResolver::resolveImports(const std::string& binary_path,
                                                    const std::vector<std::string>& imports) const {
    DependencyReport report;
    report.binary_path = binary_path;

    // First-seen order, normalized to install order below
    std::set<std::string> seen_components;
    for (const auto& raw : imports) {
        std::string library = to_lower(trim(raw));
        if (library.empty()) continue;
        if (!report.detected_imports.insert(library).second) continue;

        auto component = catalog_->lookup(library);
        if (!component) {
            report.unresolved_imports.insert(library);
            continue;
        }
        if (seen_components.insert(component->id).second) {
            report.resolved_components.push_back(*component);
        }
    }

    catalog_->sortByInstallOrder(report.resolved_components);

    if (!report.unresolved_imports.empty()) {
        spdlog::warn("{}: {} unmapped import(s) ignored", portable_filename(binary_path),
                     report.unresolved_imports.size());
    }
    return report;
}

std::vector<RuntimeComponent> DependencyResolver::installPlan(
    const DependencyReport& report, const std::vector<std::string>& extra) const {
    std::vector<RuntimeComponent> plan;
    std::set<std::string> ids;

    for (const auto& component : report.resolved_components) {
        if (component.provided_by != ComponentSource::MustInstall) continue;
        if (ids.insert(component.id).second) plan.push_back(component);
    }
    for (const auto& id : extra) {
        if (id.empty()) continue;
        if (ids.insert(id).second) plan.push_back(RuntimeComponent{id, ComponentSource::MustInstall});
    }

    catalog_->sortByInstallOrder(plan);
    return plan;
}

} // namespace cork
