#pragma once

#include "cork/environment_gateway.hpp"
#include "cork/lease_table.hpp"
#include "cork/shortcut_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cork {

// ============================================================================
// Shortcut Manager
// ============================================================================

/**
 * Keeps exactly one shortcut per (bottle, display name) across the
 * environment manager's own registry and the manual sidecar records.
 *
 * A native entry is always authoritative: manual writes that would shadow
 * one are skipped, and adopting a native entry drops any manual record with
 * the same key. A write is refused when the native registry cannot be
 * listed. Writes for a bottle are serialized; reads take no lock.
 */
class ShortcutManager {
public:
    ShortcutManager(std::shared_ptr<EnvironmentGateway> gateway, std::shared_ptr<ShortcutStore> store);

    /// Returns the entry that is authoritative after the call
    Result<ShortcutEntry> upsert(const ShortcutEntry& entry);

    std::optional<ShortcutEntry> find(const std::string& bottle_name, const std::string& display_name) const;

    /// Every shortcut of a bottle, native entries first
    std::vector<ShortcutEntry> list(const std::string& bottle_name) const;

private:
    Result<std::vector<ShortcutEntry>> nativeListing(const std::string& bottle_name) const;
    // Read paths only: a failed listing degrades to the sidecar view
    std::vector<ShortcutEntry> nativeEntries(const std::string& bottle_name) const;

    Result<ShortcutEntry> upsertManual(const ShortcutEntry& entry);
    Result<ShortcutEntry> upsertNative(const ShortcutEntry& entry);

    std::shared_ptr<EnvironmentGateway> gateway_;
    std::shared_ptr<ShortcutStore> store_;
    LeaseTable write_locks_;
};

} // namespace cork
