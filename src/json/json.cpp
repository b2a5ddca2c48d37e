#include "cork/json.hpp"

namespace cork {

nlohmann::json to_json(const Error& error) {
    nlohmann::json j;
    j["kind"] = error_code_to_string(error.code());
    j["stage"] = error.stage();
    j["message"] = error.message();
    return j;
}

nlohmann::json to_json(const TargetClassification& classification) {
    nlohmann::json j;
    j["kind"] = target_kind_to_string(classification.kind);
    j["reason"] = classification.reason;
    return j;
}

nlohmann::json to_json(const RuntimeComponent& component) {
    nlohmann::json j;
    j["id"] = component.id;
    j["provided_by"] = component_source_to_string(component.provided_by);
    return j;
}

nlohmann::json to_json(const DependencyReport& report) {
    nlohmann::json j;
    j["binary_path"] = report.binary_path;
    j["detected_imports"] = report.detected_imports;
    j["unresolved_imports"] = report.unresolved_imports;

    nlohmann::json components = nlohmann::json::array();
    for (const auto& c : report.resolved_components) {
        components.push_back(to_json(c));
    }
    j["resolved_components"] = components;

    if (!report.warnings.empty()) {
        j["warnings"] = report.warnings;
    }
    return j;
}

nlohmann::json to_json(const ShortcutEntry& entry) {
    nlohmann::json j;
    j["bottle_name"] = entry.bottle_name;
    j["display_name"] = entry.display_name;
    j["target_executable_path"] = entry.target_executable_path;
    j["source"] = shortcut_source_to_string(entry.source);
    return j;
}

nlohmann::json to_json(const InstallOutcome& outcome) {
    nlohmann::json j;
    j["ok"] = outcome.succeeded();
    j["status"] = outcome.succeeded() ? "Succeeded" : "Failed";
    j["bottle"] = outcome.bottle_name;
    j["kind"] = target_kind_to_string(outcome.kind);
    j["states"] = outcome.states;

    if (outcome.shortcut) j["shortcut"] = to_json(*outcome.shortcut);
    if (outcome.error) j["error"] = to_json(*outcome.error);
    if (outcome.dependencies) j["dependencies"] = to_json(*outcome.dependencies);
    return j;
}

} // namespace cork
