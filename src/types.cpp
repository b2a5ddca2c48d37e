#include "cork/types.hpp"
#include "cork/platform.hpp"

namespace cork {

std::optional<DeclaredKind> parse_declared_kind(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "file") return DeclaredKind::File;
    if (v == "folder" || v == "directory" || v == "dir") return DeclaredKind::Folder;
    if (v == "unknown" || v.empty()) return DeclaredKind::Unknown;
    return std::nullopt;
}

std::optional<StrategyHint> parse_strategy_hint(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "exe" || v == "msi" || v == "executable") return StrategyHint::Executable;
    if (v == "iso" || v == "image" || v == "diskimage") return StrategyHint::DiskImage;
    if (v == "folder" || v == "directory") return StrategyHint::Folder;
    return std::nullopt;
}

} // namespace cork
