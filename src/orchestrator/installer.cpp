#include "cork/installer.hpp"
#include "cork/platform.hpp"

#include <spdlog/spdlog.h>

namespace cork {

Result<EnvironmentInfo> Installer::prepareEnvironment(const InstallContext& ctx) {
    return services_.gateway->ensureEnvironment(ctx.bottle_name);
}

Result<void> Installer::resolveDependencies(const InstallContext& ctx, const std::string& binary,
                                            bool fresh_environment, InstallOutcome& outcome) {
    DependencyReport report = services_.resolver->resolve(binary);
    outcome.dependencies = report;

    std::vector<std::string> extra;
    if (fresh_environment) {
        extra = services_.config.baseline_components;
    }
    auto plan = services_.resolver->installPlan(report, extra);

    spdlog::info("[{}] {} component(s) to install for {}", ctx.bottle_name, plan.size(),
                 portable_filename(binary));

    // Sequential, first failure stops the run
    for (const auto& component : plan) {
        if (ctx.cancel.cancelled()) {
            return Result<void>::err(Error(ErrorCode::CANCELLED, stage::DEPENDENCIES, "cancelled"));
        }
        spdlog::info("[{}] installing {}", ctx.bottle_name, component.id);
        auto installed = services_.gateway->installComponent(ctx.bottle_name, component.id);
        if (installed.isErr()) return installed;
    }
    return Result<void>::ok();
}

Result<int> Installer::execute(const InstallContext& ctx, const std::string& binary) {
    spdlog::info("[{}] running {}", ctx.bottle_name, binary);
    return services_.gateway->runBinary(ctx.bottle_name, binary,
                                        std::chrono::seconds(services_.config.timeouts.run_binary));
}

InstallOutcome Installer::begin(const InstallContext& ctx) const {
    InstallOutcome outcome;
    outcome.bottle_name = ctx.bottle_name;
    outcome.kind = ctx.classification.kind;
    outcome.states.push_back("Created");
    spdlog::info("[{}] {} install of {} ({})", ctx.bottle_name, name(), ctx.request.target_path,
                 ctx.classification.reason);
    return outcome;
}

void Installer::enter(const InstallContext& ctx, InstallOutcome& outcome, const char* state) const {
    spdlog::info("[{}] {} -> {}", ctx.bottle_name, outcome.states.back(), state);
    outcome.states.push_back(state);
    if (std::string(state) == "Done") {
        outcome.status = InstallStatus::Succeeded;
    }
}

void Installer::fail(const InstallContext& ctx, InstallOutcome& outcome, Error error) const {
    if (error.code() == ErrorCode::CANCELLED) {
        spdlog::warn("[{}] cancelled before {}", ctx.bottle_name, error.stage());
    } else {
        spdlog::error("[{}] {} failed at {}: {}", ctx.bottle_name, name(), error.stage(), error.message());
    }
    outcome.states.push_back("Failed");
    outcome.status = InstallStatus::Failed;
    outcome.error = std::move(error);
}

bool Installer::checkpoint(const InstallContext& ctx, InstallOutcome& outcome, const char* next_stage) const {
    if (!ctx.cancel.cancelled()) return true;
    fail(ctx, outcome, Error(ErrorCode::CANCELLED, next_stage, "cancelled"));
    return false;
}

} // namespace cork
