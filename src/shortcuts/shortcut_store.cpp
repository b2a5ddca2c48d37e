#include "cork/shortcut_store.hpp"
#include "cork/platform.hpp"

#include <algorithm>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cork {

namespace fs = std::filesystem;

namespace {

constexpr const char* SHORTCUT_SCHEMA = "cork.shortcuts.v1";

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

ShortcutRecordParseResult parse_shortcut_record(const std::string& json_str) {
    ShortcutRecordParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto schema = get_string(j, "$schema");
        if (!schema || trim(*schema) != SHORTCUT_SCHEMA) {
            result.error = "$schema mismatch: expected cork.shortcuts.v1";
            return result;
        }

        auto bottle = get_string(j, "bottle");
        if (!bottle || bottle->empty()) {
            result.error = "bottle missing";
            return result;
        }
        result.record.bottle = *bottle;

        if (j.contains("shortcuts") && j["shortcuts"].is_array()) {
            for (const auto& s : j["shortcuts"]) {
                auto name = s.is_object() ? get_string(s, "display_name") : std::nullopt;
                auto target = s.is_object() ? get_string(s, "target_executable_path") : std::nullopt;
                if (!name || name->empty() || !target) {
                    result.warnings.push_back("invalid_entry");
                    continue;
                }

                auto dup = std::find_if(result.record.shortcuts.begin(), result.record.shortcuts.end(),
                                        [&](const ShortcutEntry& e) { return e.display_name == *name; });
                if (dup != result.record.shortcuts.end()) {
                    // Later entry wins
                    result.warnings.push_back("duplicate_entry:" + *name);
                    dup->target_executable_path = *target;
                    continue;
                }

                ShortcutEntry entry;
                entry.bottle_name = result.record.bottle;
                entry.display_name = *name;
                entry.target_executable_path = *target;
                entry.source = ShortcutSource::ManualRecord;
                result.record.shortcuts.push_back(std::move(entry));
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    }
}

std::string serialize_shortcut_record(const ShortcutRecord& record) {
    nlohmann::json j;
    j["$schema"] = SHORTCUT_SCHEMA;
    j["bottle"] = record.bottle;

    nlohmann::json shortcuts = nlohmann::json::array();
    for (const auto& s : record.shortcuts) {
        shortcuts.push_back({
            {"display_name", s.display_name},
            {"target_executable_path", s.target_executable_path},
        });
    }
    j["shortcuts"] = shortcuts;

    return j.dump(2) + "\n";
}

// ============================================================================
// ShortcutStore
// ============================================================================

ShortcutStore::ShortcutStore(std::string directory) : directory_(std::move(directory)) {}

std::string ShortcutStore::recordPath(const std::string& bottle) const {
    return (fs::path(directory_) / (bottle + ".json")).string();
}

Result<ShortcutRecord> ShortcutStore::load(const std::string& bottle) const {
    std::string path = recordPath(bottle);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        ShortcutRecord empty;
        empty.bottle = bottle;
        return Result<ShortcutRecord>::ok(empty);
    }

    auto content = read_file(path);
    if (!content) {
        return Result<ShortcutRecord>::err(
            Error(ErrorCode::IO_ERROR, stage::SHORTCUT, "failed to read " + path));
    }

    auto parsed = parse_shortcut_record(*content);
    if (!parsed.ok) {
        return Result<ShortcutRecord>::err(
            Error(ErrorCode::IO_ERROR, stage::SHORTCUT, path + ": " + parsed.error));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}: {}", path, w);
    }

    // The file name is authoritative for the bottle
    parsed.record.bottle = bottle;
    for (auto& s : parsed.record.shortcuts) {
        s.bottle_name = bottle;
    }
    return Result<ShortcutRecord>::ok(parsed.record);
}

std::optional<ShortcutEntry> ShortcutStore::find(const std::string& bottle,
                                                 const std::string& display_name) const {
    auto record = load(bottle);
    if (record.isErr()) {
        spdlog::warn("{}", record.error().message());
        return std::nullopt;
    }
    for (const auto& s : record.value().shortcuts) {
        if (s.display_name == display_name) return s;
    }
    return std::nullopt;
}

Result<void> ShortcutStore::save(const ShortcutRecord& record) {
    if (!create_directories(directory_)) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, stage::SHORTCUT, "cannot create " + directory_));
    }

    auto written = atomic_write_file(recordPath(record.bottle), serialize_shortcut_record(record));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, stage::SHORTCUT, written.error));
    }
    return Result<void>::ok();
}

Result<void> ShortcutStore::put(const ShortcutEntry& entry) {
    auto loaded = load(entry.bottle_name);
    if (loaded.isErr()) return Result<void>::err(loaded.error());

    ShortcutRecord record = loaded.value();
    ShortcutEntry stored = entry;
    stored.source = ShortcutSource::ManualRecord;

    auto it = std::find_if(record.shortcuts.begin(), record.shortcuts.end(),
                           [&](const ShortcutEntry& e) { return e.display_name == entry.display_name; });
    if (it != record.shortcuts.end()) {
        *it = stored;
    } else {
        record.shortcuts.push_back(stored);
    }
    return save(record);
}

Result<bool> ShortcutStore::remove(const std::string& bottle, const std::string& display_name) {
    auto loaded = load(bottle);
    if (loaded.isErr()) return Result<bool>::err(loaded.error());

    ShortcutRecord record = loaded.value();
    auto before = record.shortcuts.size();
    record.shortcuts.erase(std::remove_if(record.shortcuts.begin(), record.shortcuts.end(),
                                          [&](const ShortcutEntry& e) {
                                              return e.display_name == display_name;
                                          }),
                           record.shortcuts.end());
    if (record.shortcuts.size() == before) return Result<bool>::ok(false);

    auto saved = save(record);
    if (saved.isErr()) return Result<bool>::err(saved.error());
    return Result<bool>::ok(true);
}

} // namespace cork
