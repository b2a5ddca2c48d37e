#include "cork/orchestrator.hpp"
#include "cork/file_installer.hpp"
#include "cork/folder_installer.hpp"
#include "cork/platform.hpp"

#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace cork {

namespace fs = std::filesystem;

namespace {

constexpr size_t MIN_BOTTLE_NAME = 2;
constexpr size_t MAX_BOTTLE_NAME = 32;

bool is_bottle_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ' ' || c == '.' ||
           c == '\'';
}

InstallOutcome rejected(const std::string& bottle, Error error) {
    InstallOutcome outcome;
    outcome.bottle_name = bottle;
    outcome.states.push_back("Failed");
    outcome.status = InstallStatus::Failed;
    outcome.error = std::move(error);
    return outcome;
}

} // namespace

bool is_valid_bottle_name(const std::string& name) {
    if (name.size() < MIN_BOTTLE_NAME || name.size() > MAX_BOTTLE_NAME) return false;

    bool has_alnum = false;
    for (char c : name) {
        if (!is_bottle_name_char(c)) return false;
        if (std::isalnum(static_cast<unsigned char>(c))) has_alnum = true;
    }
    return has_alnum;
}

std::string derive_bottle_name(const std::string& target_path) {
    std::error_code ec;
    std::string base = fs::is_directory(target_path, ec) ? folder_name(target_path)
                                                         : fs::path(portable_filename(target_path)).stem().string();

    std::string name;
    for (char c : base) {
        name.push_back(is_bottle_name_char(c) ? c : '_');
    }
    name = trim(name);
    if (name.size() > MAX_BOTTLE_NAME) name = trim(name.substr(0, MAX_BOTTLE_NAME));
    return name;
}

// ============================================================================
// Orchestrator
// ============================================================================

Result<std::unique_ptr<Orchestrator>> Orchestrator::create(CorkConfig config,
                                                           std::shared_ptr<EnvironmentGateway> gateway) {
    using R = Result<std::unique_ptr<Orchestrator>>;

    if (!gateway) {
        return R::err(Error(ErrorCode::CONFIG_ERROR, "", "no environment gateway"));
    }

    auto catalog = std::make_shared<DependencyCatalog>(DependencyCatalog::builtin());

    if (!config.catalog_extensions.empty()) {
        auto content = read_file(config.catalog_extensions);
        if (!content) {
            return R::err(Error(ErrorCode::CONFIG_ERROR, "",
                                "failed to read catalog extensions: " + config.catalog_extensions));
        }
        auto extended = extend_catalog(*catalog, *content);
        if (!extended.ok) {
            return R::err(Error(ErrorCode::CONFIG_ERROR, "",
                                config.catalog_extensions + ": " + extended.error));
        }
        for (const auto& w : extended.warnings) {
            spdlog::warn("{}: {}", config.catalog_extensions, w);
        }
        spdlog::debug("catalog: {} extension(s) from {}", extended.added, config.catalog_extensions);
    }

    return R::ok(std::unique_ptr<Orchestrator>(
        new Orchestrator(std::move(config), std::move(gateway), std::move(catalog))));
}

Orchestrator::Orchestrator(CorkConfig config, std::shared_ptr<EnvironmentGateway> gateway,
                           std::shared_ptr<const DependencyCatalog> catalog)
    : config_(std::move(config)), gateway_(std::move(gateway)), catalog_(std::move(catalog)) {
    resolver_ = std::make_shared<DependencyResolver>(catalog_);
    shortcuts_ = std::make_shared<ShortcutManager>(gateway_, std::make_shared<ShortcutStore>(config_.shortcuts_dir));

    InstallerServices services{gateway_, resolver_, shortcuts_, config_};
    router_ = std::make_unique<StrategyRouter>(std::make_shared<FileInstaller>(services),
                                               std::make_shared<FolderInstaller>(services));
}

InstallOutcome Orchestrator::install(const InstallRequest& request, CancellationToken cancel) {
    std::string bottle = request.bottle_name ? trim(*request.bottle_name) : derive_bottle_name(request.target_path);

    if (!is_valid_bottle_name(bottle)) {
        spdlog::error("rejected request for {}: invalid bottle name '{}'", request.target_path, bottle);
        return rejected(bottle, Error(ErrorCode::CLASSIFICATION, stage::REQUEST,
                                      "invalid bottle name '" + bottle + "'"));
    }

    if (leases_.waiting(bottle) > 0) {
        spdlog::info("[{}] waiting for the running install to finish", bottle);
    }
    Lease lease = leases_.acquire(bottle);

    if (cancel.cancelled()) {
        return rejected(bottle, Error(ErrorCode::CANCELLED, stage::CLASSIFICATION, "cancelled"));
    }

    TargetClassification classification = classify_target(request);
    if (classification.kind == TargetKind::Invalid) {
        spdlog::error("[{}] {}: {}", bottle, request.target_path, classification.reason);
        return rejected(bottle, Error(ErrorCode::CLASSIFICATION, stage::CLASSIFICATION,
                                      request.target_path + ": " + classification.reason));
    }

    auto installer = router_->select(classification);

    InstallContext ctx;
    ctx.request = request;
    ctx.classification = classification;
    ctx.bottle_name = bottle;
    ctx.cancel = cancel;

    InstallOutcome outcome = installer->run(ctx);
    if (outcome.succeeded()) {
        spdlog::info("[{}] installed {}", bottle, request.target_path);
    }
    return outcome;
}

DependencyReport Orchestrator::analyze(const std::string& binary_path) const {
    return resolver_->resolve(binary_path);
}

TargetClassification Orchestrator::classify(const InstallRequest& request) const {
    return router_->classify(request);
}

std::optional<ShortcutEntry> Orchestrator::findShortcut(const std::string& bottle_name,
                                                        const std::string& display_name) const {
    return shortcuts_->find(bottle_name, display_name);
}

std::vector<ShortcutEntry> Orchestrator::listShortcuts(const std::string& bottle_name) const {
    return shortcuts_->list(bottle_name);
}

} // namespace cork
