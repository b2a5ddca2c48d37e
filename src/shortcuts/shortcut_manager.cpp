#include "cork/shortcut_manager.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace cork {

namespace {

std::optional<ShortcutEntry> find_by_name(const std::vector<ShortcutEntry>& entries,
                                          const std::string& display_name) {
    for (const auto& e : entries) {
        if (e.display_name == display_name) return e;
    }
    return std::nullopt;
}

} // namespace

ShortcutManager::ShortcutManager(std::shared_ptr<EnvironmentGateway> gateway,
                                 std::shared_ptr<ShortcutStore> store)
    : gateway_(std::move(gateway)), store_(std::move(store)) {}

Result<std::vector<ShortcutEntry>> ShortcutManager::nativeListing(const std::string& bottle_name) const {
    auto listed = gateway_->listNativeShortcuts(bottle_name);
    if (listed.isErr()) {
        return Result<std::vector<ShortcutEntry>>::err(
            Error(ErrorCode::IO_ERROR, stage::SHORTCUT,
                  "cannot list native shortcuts of " + bottle_name + ": " + listed.error().message()));
    }

    auto entries = listed.value();
    for (auto& e : entries) {
        e.bottle_name = bottle_name;
        e.source = ShortcutSource::EnvironmentNative;
    }
    return Result<std::vector<ShortcutEntry>>::ok(std::move(entries));
}

std::vector<ShortcutEntry> ShortcutManager::nativeEntries(const std::string& bottle_name) const {
    auto listed = nativeListing(bottle_name);
    if (listed.isErr()) {
        spdlog::warn("{}", listed.error().message());
        return {};
    }
    return listed.value();
}

Result<ShortcutEntry> ShortcutManager::upsert(const ShortcutEntry& entry) {
    if (entry.bottle_name.empty() || entry.display_name.empty()) {
        return Result<ShortcutEntry>::err(
            Error(ErrorCode::IO_ERROR, stage::SHORTCUT, "shortcut needs a bottle and a display name"));
    }

    Lease lock = write_locks_.acquire(entry.bottle_name);
    if (entry.source == ShortcutSource::ManualRecord) {
        return upsertManual(entry);
    }
    return upsertNative(entry);
}

Result<ShortcutEntry> ShortcutManager::upsertManual(const ShortcutEntry& entry) {
    // Without the native listing a manual write could shadow an entry we cannot see
    auto native_listing = nativeListing(entry.bottle_name);
    if (native_listing.isErr()) return Result<ShortcutEntry>::err(native_listing.error());

    if (auto native = find_by_name(native_listing.value(), entry.display_name)) {
        Error conflict(ErrorCode::SHORTCUT_CONFLICT, stage::SHORTCUT,
                       "'" + entry.display_name + "' already registered by the environment manager");
        spdlog::warn("{}: {}", entry.bottle_name, conflict.message());
        return Result<ShortcutEntry>::ok(*native);
    }

    auto stored = store_->put(entry);
    if (stored.isErr()) return Result<ShortcutEntry>::err(stored.error());

    ShortcutEntry result = entry;
    result.source = ShortcutSource::ManualRecord;
    spdlog::info("{}: recorded shortcut '{}'", entry.bottle_name, entry.display_name);
    return Result<ShortcutEntry>::ok(result);
}

Result<ShortcutEntry> ShortcutManager::upsertNative(const ShortcutEntry& entry) {
    ShortcutEntry result = entry;
    result.source = ShortcutSource::EnvironmentNative;

    auto native_listing = nativeListing(entry.bottle_name);
    if (native_listing.isErr()) return Result<ShortcutEntry>::err(native_listing.error());

    if (auto native = find_by_name(native_listing.value(), entry.display_name)) {
        result = *native;
    } else {
        auto created = gateway_->createNativeShortcut(entry.bottle_name, entry.display_name,
                                                      entry.target_executable_path);
        if (created.isErr()) {
            // Keep the shortcut reachable through the sidecar instead
            spdlog::warn("{}: {}; falling back to a manual record", entry.bottle_name,
                         created.error().message());
            auto stored = store_->put(entry);
            if (stored.isErr()) return Result<ShortcutEntry>::err(stored.error());
            result.source = ShortcutSource::ManualRecord;
            return Result<ShortcutEntry>::ok(result);
        }
    }

    // A native entry supersedes any manual record with the same key
    auto removed = store_->remove(entry.bottle_name, entry.display_name);
    if (removed.isErr()) {
        spdlog::warn("{}: {}", entry.bottle_name, removed.error().message());
    } else if (removed.value()) {
        spdlog::info("{}: manual record '{}' superseded by native shortcut", entry.bottle_name,
                     entry.display_name);
    }
    return Result<ShortcutEntry>::ok(result);
}

std::optional<ShortcutEntry> ShortcutManager::find(const std::string& bottle_name,
                                                   const std::string& display_name) const {
    if (auto native = find_by_name(nativeEntries(bottle_name), display_name)) {
        return native;
    }
    return store_->find(bottle_name, display_name);
}

std::vector<ShortcutEntry> ShortcutManager::list(const std::string& bottle_name) const {
    std::vector<ShortcutEntry> entries = nativeEntries(bottle_name);

    std::set<std::string> names;
    for (const auto& e : entries) names.insert(e.display_name);

    auto record = store_->load(bottle_name);
    if (record.isErr()) {
        spdlog::warn("{}", record.error().message());
        return entries;
    }
    for (const auto& e : record.value().shortcuts) {
        if (names.insert(e.display_name).second) entries.push_back(e);
    }
    return entries;
}

} // namespace cork
