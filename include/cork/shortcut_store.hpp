#pragma once

#include "cork/result.hpp"
#include "cork/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Shortcut Sidecar Record
// ============================================================================

/**
 * One file per bottle:
 *
 *   {
 *     "$schema": "cork.shortcuts.v1",
 *     "bottle": "<name>",
 *     "shortcuts": [ { "display_name": "...", "target_executable_path": "..." } ]
 *   }
 */
struct ShortcutRecord {
    std::string bottle;
    std::vector<ShortcutEntry> shortcuts;  // All ManualRecord, unique by display_name
};

struct ShortcutRecordParseResult {
    bool ok = false;
    std::string error;
    ShortcutRecord record;
    std::vector<std::string> warnings;
};

ShortcutRecordParseResult parse_shortcut_record(const std::string& json_str);

std::string serialize_shortcut_record(const ShortcutRecord& record);

// ============================================================================
// Shortcut Store
// ============================================================================

/**
 * Manual shortcut records under a directory. Every write replaces the whole
 * file atomically, so a reader never sees a torn record.
 */
class ShortcutStore {
public:
    explicit ShortcutStore(std::string directory);

    /// Missing file loads as an empty record
    Result<ShortcutRecord> load(const std::string& bottle) const;

    std::optional<ShortcutEntry> find(const std::string& bottle, const std::string& display_name) const;

    /// Insert or replace by display_name
    Result<void> put(const ShortcutEntry& entry);

    /// Returns true if an entry was removed
    Result<bool> remove(const std::string& bottle, const std::string& display_name);

    std::string recordPath(const std::string& bottle) const;

private:
    Result<void> save(const ShortcutRecord& record);

    std::string directory_;
};

} // namespace cork
