#include "cork/file_installer.hpp"
#include "cork/platform.hpp"

#include <filesystem>
#include <thread>

#include <spdlog/spdlog.h>

namespace cork {

namespace fs = std::filesystem;

std::optional<ShortcutEntry> match_native_shortcut(const std::vector<ShortcutEntry>& now,
                                                   const std::vector<ShortcutEntry>& before,
                                                   const std::string& binary) {
    std::string wanted = to_lower(portable_filename(binary));
    for (const auto& e : now) {
        if (!e.target_executable_path.empty() &&
            to_lower(portable_filename(e.target_executable_path)) == wanted) {
            return e;
        }
    }

    for (const auto& e : now) {
        bool existed = false;
        for (const auto& old : before) {
            if (old.display_name == e.display_name) {
                existed = true;
                break;
            }
        }
        if (!existed) return e;
    }
    return std::nullopt;
}

ShortcutEntry FileInstaller::awaitShortcut(const InstallContext& ctx, const std::string& binary,
                                           const std::vector<ShortcutEntry>& before) {
    const auto& poll = services_.config.shortcut_poll;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(poll.window_ms);

    for (;;) {
        auto listed = services_.gateway->listNativeShortcuts(ctx.bottle_name);
        if (listed.isOk()) {
            if (auto found = match_native_shortcut(listed.value(), before, binary)) {
                spdlog::info("[{}] adopting native shortcut '{}'", ctx.bottle_name, found->display_name);
                found->bottle_name = ctx.bottle_name;
                found->source = ShortcutSource::EnvironmentNative;
                if (found->target_executable_path.empty()) found->target_executable_path = binary;
                return *found;
            }
        } else {
            spdlog::debug("[{}] {}", ctx.bottle_name, listed.error().message());
        }

        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(poll.interval_ms));
    }

    ShortcutEntry synthesized;
    synthesized.bottle_name = ctx.bottle_name;
    synthesized.display_name = fs::path(portable_filename(binary)).stem().string();
    synthesized.target_executable_path = binary;
    synthesized.source = ShortcutSource::EnvironmentNative;
    spdlog::info("[{}] no native shortcut appeared; using '{}'", ctx.bottle_name, synthesized.display_name);
    return synthesized;
}

InstallOutcome FileInstaller::run(const InstallContext& ctx) {
    InstallOutcome outcome = begin(ctx);

    State state = State::Created;
    bool fresh_environment = false;
    std::string binary;
    std::vector<ShortcutEntry> before;

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
                if (!checkpoint(ctx, outcome, stage::STAGING)) {
                    state = State::Failed;
                    break;
                }
                if (ctx.classification.kind == TargetKind::DiskImage) {
                    auto mounted = services_.gateway->mountImage(ctx.bottle_name, ctx.request.target_path);
                    if (mounted.isErr()) {
                        fail(ctx, outcome, mounted.error());
                        state = State::Failed;
                        break;
                    }
                    binary = mounted.value();
                } else {
                    std::error_code ec;
                    auto absolute = fs::absolute(ctx.request.target_path, ec);
                    binary = ec ? ctx.request.target_path : absolute.lexically_normal().string();
                }
                enter(ctx, outcome, "Staged");
                state = State::Staged;
                break;
            }

            case State::Staged: {
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
                // Snapshot so entries registered by this run can be told apart
                auto listed = services_.gateway->listNativeShortcuts(ctx.bottle_name);
                if (listed.isOk()) before = listed.value();

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
                ShortcutEntry entry = awaitShortcut(ctx, binary, before);
                auto stored = services_.shortcuts->upsert(entry);
                if (stored.isOk()) {
                    outcome.shortcut = stored.value();
                } else {
                    // Bookkeeping only; the install itself succeeded without a shortcut
                    spdlog::warn("[{}] {}", ctx.bottle_name, stored.error().message());
                }
                enter(ctx, outcome, "ShortcutCreated");
                state = State::ShortcutCreated;
                break;
            }

            case State::ShortcutCreated:
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
