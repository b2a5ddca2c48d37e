#include "cork/bottles_gateway.hpp"
#include "cork/platform.hpp"

#include <algorithm>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cork {

namespace fs = std::filesystem;

namespace {

constexpr size_t MAX_DIAGNOSTIC_LENGTH = 200;

const char* const IMAGE_INSTALLER_NAMES[] = {"setup.exe", "install.exe", "autorun.exe", "start.exe"};

// Last non-empty line of stderr (or stdout), trimmed to a readable length
std::string describe_failure(const ProcessResult& result) {
    if (!result.ok) return result.error;

    const std::string& text = result.errors.empty() ? result.output : result.errors;
    std::string last;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = trim(text.substr(start, end - start));
        if (!line.empty()) last = line;
        start = end + 1;
    }

    std::string message = "exit code " + std::to_string(result.exit_code);
    if (!last.empty()) {
        if (last.size() > MAX_DIAGNOSTIC_LENGTH) last = last.substr(0, MAX_DIAGNOSTIC_LENGTH) + "...";
        message += ": " + last;
    }
    return message;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

// Installer candidate in one directory, by name priority
std::string pick_installer(const fs::path& dir) {
    std::error_code ec;
    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) files.push_back(it->path());
    }

    for (const char* wanted : IMAGE_INSTALLER_NAMES) {
        for (const auto& f : files) {
            if (to_lower(f.filename().string()) == wanted) return f.string();
        }
    }
    return "";
}

std::optional<std::string> json_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

} // namespace

BottlesGateway::BottlesGateway(CorkConfig config) : config_(std::move(config)) {}

std::string BottlesGateway::storagePath(const std::string& env) const {
    return (fs::path(config_.prefix_base) / env).string();
}

ProcessResult BottlesGateway::invoke(const std::vector<std::string>& prefix,
                                     const std::vector<std::string>& args,
                                     std::chrono::seconds timeout, const std::string& env) const {
    ProcessSpec spec;
    spec.argv = prefix;
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.timeout = timeout;
    if (!env.empty()) {
        spec.environment.emplace_back("WINEPREFIX", storagePath(env));
    }

    spdlog::debug("exec: {}", format_command(spec.argv));
    auto result = run_process(spec);
    spdlog::debug("exit: {}{}", result.exit_code, result.timed_out ? " (timed out)" : "");
    return result;
}

// ============================================================================
// Environments
// ============================================================================

Result<EnvironmentInfo> BottlesGateway::ensureEnvironment(const std::string& name) {
    EnvironmentInfo info;
    info.name = name;
    info.prefix_path = storagePath(name);

    std::error_code ec;
    if (fs::exists(fs::path(info.prefix_path) / "drive_c", ec) ||
        fs::exists(fs::path(info.prefix_path) / "bottle.yml", ec)) {
        return Result<EnvironmentInfo>::ok(info);
    }

    auto result = invoke(config_.commands.bottles_cli,
                         {"new", "--bottle-name", name, "--environment", config_.environment_template},
                         std::chrono::seconds(config_.timeouts.default_seconds));

    if (result.timed_out) {
        return Result<EnvironmentInfo>::err(
            Error(ErrorCode::ENVIRONMENT, stage::ENVIRONMENT,
                  "creating '" + name + "' timed out after " +
                      std::to_string(config_.timeouts.default_seconds) + "s"));
    }

    bool already_exists = result.ok && (contains_ci(result.errors, "already exists") ||
                                        contains_ci(result.output, "already exists"));
    if (!result.ok || (result.exit_code != 0 && !already_exists)) {
        return Result<EnvironmentInfo>::err(Error(ErrorCode::ENVIRONMENT, stage::ENVIRONMENT,
                                                  "creating '" + name + "' failed: " +
                                                      describe_failure(result)));
    }

    if (!fs::is_directory(info.prefix_path, ec)) {
        return Result<EnvironmentInfo>::err(
            Error(ErrorCode::ENVIRONMENT, stage::ENVIRONMENT,
                  "environment '" + name + "' not found at " + info.prefix_path + " after creation"));
    }

    info.created = !already_exists;
    if (info.created) {
        spdlog::info("Created environment '{}' ({})", name, config_.environment_template);
        repairPrefix(name);
    }
    return Result<EnvironmentInfo>::ok(info);
}

void BottlesGateway::repairPrefix(const std::string& env) const {
    if (config_.commands.wine.empty()) return;

    auto result = invoke(config_.commands.wine, {"wineboot", "--repair"},
                         std::chrono::seconds(config_.timeouts.wineserver_wait), env);
    if (result.timed_out) {
        spdlog::warn("{}: wineboot --repair timed out after {}s", env, config_.timeouts.wineserver_wait);
    } else if (!result.ok || result.exit_code != 0) {
        spdlog::warn("{}: wineboot --repair failed: {}", env, describe_failure(result));
    }
}

// ============================================================================
// Staging
// ============================================================================

std::string find_image_installer(const std::string& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return "";

    std::string top = pick_installer(root);
    if (!top.empty()) return top;

    std::vector<fs::path> subdirs;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) subdirs.push_back(it->path());
    }
    std::sort(subdirs.begin(), subdirs.end());

    for (const auto& dir : subdirs) {
        std::string found = pick_installer(dir);
        if (!found.empty()) return found;
    }
    return "";
}

Result<std::string> BottlesGateway::mountImage(const std::string& env, const std::string& image_path) {
    std::error_code ec;
    if (!fs::is_regular_file(image_path, ec)) {
        return Result<std::string>::err(
            Error(ErrorCode::STAGING, stage::STAGING, "image not found: " + image_path));
    }

    // One staging tree per bottle; installs into the same bottle never overlap
    fs::path target = fs::path(config_.staging_dir) / env / fs::path(image_path).stem();
    fs::remove_all(target, ec);
    if (ec || !create_directories(target.string())) {
        return Result<std::string>::err(
            Error(ErrorCode::STAGING, stage::STAGING, "cannot prepare " + target.string()));
    }

    spdlog::info("Extracting {} -> {}", image_path, target.string());
    auto result = invoke(config_.commands.extractor, {"x", image_path, "-o" + target.string(), "-y"},
                         std::chrono::seconds(config_.timeouts.default_seconds));

    if (result.timed_out) {
        return Result<std::string>::err(
            Error(ErrorCode::STAGING, stage::STAGING, "extraction of " + image_path + " timed out"));
    }
    if (!result.ok || result.exit_code != 0) {
        return Result<std::string>::err(Error(ErrorCode::STAGING, stage::STAGING,
                                              "extraction failed: " + describe_failure(result)));
    }

    std::string installer = find_image_installer(target.string());
    if (installer.empty()) {
        return Result<std::string>::err(
            Error(ErrorCode::STAGING, stage::STAGING, "no installer found in " + image_path));
    }
    return Result<std::string>::ok(installer);
}

Result<void> BottlesGateway::copyTree(const std::string& src, const std::string& dest) {
    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        return Result<void>::err(Error(ErrorCode::STAGING, stage::COPY, "not a directory: " + src));
    }

    fs::create_directories(dest, ec);
    if (ec) {
        return Result<void>::err(
            Error(ErrorCode::STAGING, stage::COPY, "cannot create " + dest + ": " + ec.message()));
    }

    fs::copy(src, dest,
             fs::copy_options::recursive | fs::copy_options::overwrite_existing |
                 fs::copy_options::copy_symlinks,
             ec);
    if (ec) {
        return Result<void>::err(
            Error(ErrorCode::STAGING, stage::COPY, "copy " + src + " -> " + dest + ": " + ec.message()));
    }
    return Result<void>::ok();
}

// ============================================================================
// Components and Execution
// ============================================================================

Result<void> BottlesGateway::installComponent(const std::string& env, const std::string& component_id) {
    auto result = invoke(config_.commands.winetricks, {"-q", component_id},
                         std::chrono::seconds(config_.timeouts.component_install), env);

    if (result.timed_out) {
        return Result<void>::err(Error(ErrorCode::DEPENDENCY_INSTALL, stage::DEPENDENCIES,
                                       component_id + " timed out after " +
                                           std::to_string(config_.timeouts.component_install) + "s"));
    }
    if (result.ok && contains_ci(result.output, "already installed")) {
        spdlog::info("{}: {} already installed", env, component_id);
        return Result<void>::ok();
    }
    if (!result.ok || result.exit_code != 0) {
        return Result<void>::err(Error(ErrorCode::DEPENDENCY_INSTALL, stage::DEPENDENCIES,
                                       component_id + ": " + describe_failure(result)));
    }
    return Result<void>::ok();
}

void BottlesGateway::waitForWineserver(const std::string& env) const {
    auto result = invoke(config_.commands.wineserver, {"--wait"},
                         std::chrono::seconds(config_.timeouts.wineserver_wait), env);
    if (result.timed_out) {
        spdlog::warn("{}: wineserver still busy after {}s", env, config_.timeouts.wineserver_wait);
    } else if (!result.ok || result.exit_code != 0) {
        spdlog::warn("{}: wineserver --wait failed: {}", env, describe_failure(result));
    }
}

Result<int> BottlesGateway::runBinary(const std::string& env, const std::string& binary_path,
                                      std::chrono::seconds timeout) {
    auto result = invoke(config_.commands.bottles_cli, {"run", "-b", env, "-e", binary_path}, timeout);

    if (result.timed_out) {
        return Result<int>::err(Error(ErrorCode::EXECUTION, stage::EXECUTION,
                                      portable_filename(binary_path) + " timed out after " +
                                          std::to_string(timeout.count()) + "s"));
    }
    if (!result.ok) {
        return Result<int>::err(Error(ErrorCode::EXECUTION, stage::EXECUTION, result.error));
    }

    waitForWineserver(env);

    if (result.exit_code != 0) {
        return Result<int>::err(Error(ErrorCode::EXECUTION, stage::EXECUTION,
                                      portable_filename(binary_path) + ": " + describe_failure(result)));
    }
    return Result<int>::ok(result.exit_code);
}

// ============================================================================
// Shortcuts
// ============================================================================

Result<std::vector<ShortcutEntry>> parse_program_list(const std::string& env, const std::string& output) {
    using R = Result<std::vector<ShortcutEntry>>;

    std::vector<ShortcutEntry> entries;
    if (trim(output).empty()) return R::ok(entries);

    try {
        auto j = nlohmann::json::parse(output);

        // Either a list of programs, {"programs": [...]}, or an id -> program map
        nlohmann::json programs = nlohmann::json::array();
        if (j.is_array()) {
            programs = j;
        } else if (j.is_object() && j.contains("programs")) {
            programs = j["programs"];
        } else if (j.is_object()) {
            for (auto& [id, val] : j.items()) {
                (void)id;
                programs.push_back(val);
            }
        } else {
            return R::err(Error(ErrorCode::IO_ERROR, stage::SHORTCUT, "unexpected program list format"));
        }

        if (programs.is_object()) {
            nlohmann::json flattened = nlohmann::json::array();
            for (auto& [id, val] : programs.items()) {
                (void)id;
                flattened.push_back(val);
            }
            programs = flattened;
        }

        for (const auto& p : programs) {
            if (!p.is_object()) continue;
            auto name = json_string(p, "name");
            auto path = json_string(p, "path");
            if (!path) path = json_string(p, "executable");
            if (!name || name->empty()) continue;

            ShortcutEntry entry;
            entry.bottle_name = env;
            entry.display_name = *name;
            entry.target_executable_path = path.value_or("");
            entry.source = ShortcutSource::EnvironmentNative;
            entries.push_back(std::move(entry));
        }
        return R::ok(entries);

    } catch (const nlohmann::json::exception& e) {
        return R::err(Error(ErrorCode::IO_ERROR, stage::SHORTCUT,
                            std::string("unparseable program list: ") + e.what()));
    }
}

Result<std::vector<ShortcutEntry>> BottlesGateway::listNativeShortcuts(const std::string& env) {
    auto result = invoke(config_.commands.bottles_cli, {"--json", "programs", "-b", env},
                         std::chrono::seconds(config_.timeouts.default_seconds));

    if (result.timed_out || !result.ok || result.exit_code != 0) {
        std::string cause = result.timed_out ? "timed out" : describe_failure(result);
        return Result<std::vector<ShortcutEntry>>::err(
            Error(ErrorCode::IO_ERROR, stage::SHORTCUT, "listing programs of '" + env + "': " + cause));
    }
    return parse_program_list(env, result.output);
}

Result<void> BottlesGateway::createNativeShortcut(const std::string& env, const std::string& display_name,
                                                  const std::string& binary_path) {
    auto result = invoke(config_.commands.bottles_cli,
                         {"add", "-b", env, "-n", display_name, "-p", binary_path},
                         std::chrono::seconds(config_.timeouts.default_seconds));

    if (result.timed_out || !result.ok || result.exit_code != 0) {
        std::string cause = result.timed_out ? "timed out" : describe_failure(result);
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, stage::SHORTCUT, "adding '" + display_name + "': " + cause));
    }
    return Result<void>::ok();
}

} // namespace cork
