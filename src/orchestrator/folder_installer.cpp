#include "cork/folder_installer.hpp"
#include "cork/platform.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace cork {

namespace fs = std::filesystem;

namespace {

const char* const EXCLUDED_DIRS[] = {"windows", "system32", "syswow64", "installer", "temp_installer"};

// "inst" also covers install, installer and uninst
const char* const EXCLUDED_KEYWORDS[] = {
    "uninstall", "unins", "inst", "crash", "report", "update", "patch", "readme", "vcredist", "directx", "setup",
};

// Lowercase with spaces, dashes and underscores removed
std::string normalize_name(const std::string& s) {
    std::string out;
    for (char c : to_lower(s)) {
        if (c == ' ' || c == '-' || c == '_') continue;
        out.push_back(c);
    }
    return out;
}

bool is_excluded_dir(const fs::path& dir) {
    std::string name = to_lower(dir.filename().string());
    for (const char* ex : EXCLUDED_DIRS) {
        if (name == ex) return true;
    }
    return false;
}

bool has_excluded_keyword(const std::string& stem) {
    std::string lower = to_lower(stem);
    for (const char* kw : EXCLUDED_KEYWORDS) {
        if (lower.find(kw) != std::string::npos) return true;
    }
    return false;
}

// Relative subdirectory must stay inside drive_c
bool valid_subdir(const std::string& subdir) {
    if (subdir.empty()) return false;
    fs::path p(subdir);
    if (p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

std::string folder_name(const std::string& path) {
    fs::path p = fs::path(path).lexically_normal();
    if (p.filename().empty()) p = p.parent_path();
    return p.filename().string();
}

size_t longest_common_substring(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0;

    std::vector<size_t> prev(b.size() + 1, 0);
    std::vector<size_t> cur(b.size() + 1, 0);
    size_t best = 0;
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            cur[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : 0;
            best = std::max(best, cur[j]);
        }
        std::swap(prev, cur);
    }
    return best;
}

Result<std::string> discover_launchable(const std::string& root, const std::string& hint) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<std::string>::err(
            Error(ErrorCode::DISCOVERY, stage::DISCOVERY, "not a directory: " + root));
    }

    std::vector<fs::path> found;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            if (is_excluded_dir(it->path())) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;
        if (to_lower(it->path().extension().string()) == ".exe") {
            found.push_back(it->path());
        }
    }
    if (ec) {
        return Result<std::string>::err(
            Error(ErrorCode::DISCOVERY, stage::DISCOVERY, "scanning " + root + ": " + ec.message()));
    }
    if (found.empty()) {
        return Result<std::string>::err(
            Error(ErrorCode::DISCOVERY, stage::DISCOVERY, "no launchable binary under " + root));
    }

    std::sort(found.begin(), found.end(), [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });

    std::vector<fs::path> preferred;
    for (const auto& p : found) {
        if (!has_excluded_keyword(p.stem().string())) preferred.push_back(p);
    }
    const auto& pool = preferred.empty() ? found : preferred;

    std::string wanted = normalize_name(hint);
    const fs::path* best = &pool.front();
    size_t best_score = longest_common_substring(normalize_name(best->stem().string()), wanted);
    for (const auto& p : pool) {
        size_t score = longest_common_substring(normalize_name(p.stem().string()), wanted);
        if (score > best_score) {
            best = &p;
            best_score = score;
        }
    }

    spdlog::debug("discovered {} candidate(s) under {}; chose {}", found.size(), root, best->string());
    return Result<std::string>::ok(best->string());
}

InstallOutcome FolderInstaller::run(const InstallContext& ctx) {
    InstallOutcome outcome = begin(ctx);

    State state = State::Created;
    bool fresh_environment = false;
    std::string subdir = ctx.request.target_subdir.value_or(folder_name(ctx.request.target_path));
    std::string destination;
    std::string binary;

    while (state != State::Done && state != State::Failed) {
        switch (state) {
            case State::Created: {
                if (!checkpoint(ctx, outcome, stage::ENVIRONMENT)) {
                    state = State::Failed;
                    break;
                }
                auto env = prepareEnvironment(ctx);
                if (env.isErr()) {
                    fail(ctx, outcome, env.error());
                    state = State::Failed;
                    break;
                }
                fresh_environment = env.value().created;
                enter(ctx, outcome, "EnvironmentReady");
                state = State::EnvironmentReady;
                break;
            }

            case State::EnvironmentReady: {
                if (!checkpoint(ctx, outcome, stage::COPY)) {
                    state = State::Failed;
                    break;
                }
                if (!valid_subdir(subdir)) {
                    fail(ctx, outcome,
                         Error(ErrorCode::STAGING, stage::COPY, "invalid target subdirectory '" + subdir + "'"));
                    state = State::Failed;
                    break;
                }
                destination = (fs::path(services_.gateway->storagePath(ctx.bottle_name)) / "drive_c" / subdir)
                                  .string();
                spdlog::info("[{}] copying {} -> {}", ctx.bottle_name, ctx.request.target_path, destination);
                auto copied = services_.gateway->copyTree(ctx.request.target_path, destination);
                if (copied.isErr()) {
                    fail(ctx, outcome, copied.error());
                    state = State::Failed;
                    break;
                }
                enter(ctx, outcome, "Copied");
                state = State::Copied;
                break;
            }

            case State::Copied: {
                if (!checkpoint(ctx, outcome, stage::DISCOVERY)) {
                    state = State::Failed;
                    break;
                }
                auto discovered = discover_launchable(destination, folder_name(subdir));
                if (discovered.isErr()) {
                    fail(ctx, outcome, discovered.error());
                    state = State::Failed;
                    break;
                }
                binary = discovered.value();
                enter(ctx, outcome, "ExecutableDiscovered");
                state = State::ExecutableDiscovered;
                break;
            }

            case State::ExecutableDiscovered: {
                if (!checkpoint(ctx, outcome, stage::DEPENDENCIES)) {
                    state = State::Failed;
                    break;
                }
                auto installed = resolveDependencies(ctx, binary, fresh_environment, outcome);
                if (installed.isErr()) {
                    fail(ctx, outcome, installed.error());
                    state = State::Failed;
                    break;
                }
                enter(ctx, outcome, "DependenciesResolved");
                state = State::DependenciesResolved;
                break;
            }

            case State::DependenciesResolved: {
                if (!checkpoint(ctx, outcome, stage::EXECUTION)) {
                    state = State::Failed;
                    break;
                }
                auto ran = execute(ctx, binary);
                if (ran.isErr()) {
                    fail(ctx, outcome, ran.error());
                    state = State::Failed;
                    break;
                }
                enter(ctx, outcome, "Executed");
                state = State::Executed;
                break;
            }

            case State::Executed: {
                if (!checkpoint(ctx, outcome, stage::SHORTCUT)) {
                    state = State::Failed;
                    break;
                }
                ShortcutEntry entry;
                entry.bottle_name = ctx.bottle_name;
                entry.display_name = fs::path(binary).stem().string();
                entry.target_executable_path = binary;
                entry.source = ShortcutSource::ManualRecord;

                auto stored = services_.shortcuts->upsert(entry);
                if (stored.isErr()) {
                    // The record is the only way back to a copied tree
                    fail(ctx, outcome, stored.error());
                    state = State::Failed;
                    break;
                }
                outcome.shortcut = stored.value();
                enter(ctx, outcome, "ShortcutRecorded");
                state = State::ShortcutRecorded;
                break;
            }

            case State::ShortcutRecorded:
                enter(ctx, outcome, "Done");
                state = State::Done;
                break;

            case State::Done:
            case State::Failed:
                break;
        }
    }

    return outcome;
}

} // namespace cork
