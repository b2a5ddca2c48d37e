#include "cork/router.hpp"
#include "cork/installer.hpp"
#include "cork/platform.hpp"

#include <filesystem>

namespace cork {

namespace fs = std::filesystem;

namespace {

bool hint_conflicts(const InstallRequest& request, TargetKind actual) {
    bool is_folder = actual == TargetKind::Folder;

    if (request.declared_kind == DeclaredKind::File && is_folder) return true;
    if (request.declared_kind == DeclaredKind::Folder && !is_folder) return true;

    if (request.strategy_hint) {
        switch (*request.strategy_hint) {
            case StrategyHint::Executable: return actual != TargetKind::Executable;
            case StrategyHint::DiskImage: return actual != TargetKind::DiskImage;
            case StrategyHint::Folder: return !is_folder;
        }
    }
    return false;
}

std::string describe_hint(const InstallRequest& request) {
    if (request.strategy_hint) return strategy_hint_to_string(*request.strategy_hint);
    return declared_kind_to_string(request.declared_kind);
}

} // namespace

TargetKind kind_for_extension(const std::string& path) {
    std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".exe" || ext == ".msi") return TargetKind::Executable;
    if (ext == ".iso") return TargetKind::DiskImage;
    return TargetKind::Invalid;
}

TargetClassification classify_target(const InstallRequest& request) {
    TargetClassification result;

    std::error_code ec;
    auto status = request.target_path.empty() ? fs::file_status{} : fs::status(request.target_path, ec);
    if (request.target_path.empty() || ec || !fs::exists(status)) {
        result.kind = TargetKind::Invalid;
        result.reason = "path not found";
        return result;
    }

    if (fs::is_directory(status)) {
        result.kind = TargetKind::Folder;
        result.reason = "directory";
    } else {
        result.kind = kind_for_extension(request.target_path);
        if (result.kind == TargetKind::Invalid) {
            result.reason = "unrecognized file type";
            return result;
        }
        result.reason = "extension " + to_lower(fs::path(request.target_path).extension().string());
    }

    if (hint_conflicts(request, result.kind)) {
        result.reason += " (overrides hint '" + describe_hint(request) + "')";
    }
    return result;
}

// ============================================================================
// StrategyRouter
// ============================================================================

StrategyRouter::StrategyRouter(std::shared_ptr<Installer> file_installer,
                               std::shared_ptr<Installer> folder_installer)
    : file_installer_(std::move(file_installer)), folder_installer_(std::move(folder_installer)) {}

std::shared_ptr<Installer> StrategyRouter::select(const TargetClassification& classification) const {
    switch (classification.kind) {
        case TargetKind::Executable:
        case TargetKind::DiskImage:
            return file_installer_;
        case TargetKind::Folder:
            return folder_installer_;
        case TargetKind::Invalid:
            return nullptr;
    }
    return nullptr;
}

} // namespace cork
