#pragma once

#include "cork/types.hpp"

#include <nlohmann/json.hpp>

namespace cork {

// ============================================================================
// JSON Views
// ============================================================================

nlohmann::json to_json(const Error& error);
nlohmann::json to_json(const TargetClassification& classification);
nlohmann::json to_json(const RuntimeComponent& component);
nlohmann::json to_json(const DependencyReport& report);
nlohmann::json to_json(const ShortcutEntry& entry);
nlohmann::json to_json(const InstallOutcome& outcome);

} // namespace cork
