#include "cork/dependency_catalog.hpp"
#include "cork/platform.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace cork {

namespace {

constexpr int BUILTIN_CATALOG_VERSION = 3;

// Component id for libraries the compatibility layer provides itself
constexpr const char* BASE_RUNTIME = "wine";

struct BuiltinMapping {
    const char* library;
    const char* component;
};

// Libraries mapped to installable winetricks verbs
const BuiltinMapping INSTALLABLE[] = {
    // Direct3D / DXGI (translated to Vulkan by DXVK / VKD3D)
    {"d3d9.dll", "d3dx9"},
    {"d3dx9_43.dll", "d3dx9"},
    {"d3d10.dll", "d3dx10"},
    {"d3d11.dll", "dxvk"},
    {"d3d11_1.dll", "dxvk"},
    {"d3d11_2.dll", "dxvk"},
    {"d3d11_3.dll", "dxvk"},
    {"d3d11_4.dll", "dxvk"},
    {"dxgi.dll", "dxvk"},
    {"d3d12.dll", "vkd3d"},
    {"d3dcompiler_43.dll", "d3dcompiler_43"},
    {"d3dcompiler_47.dll", "d3dcompiler_47"},

    // Input & audio
    {"xinput1_3.dll", "xinput"},
    {"xinput1_4.dll", "xinput"},
    {"dinput8.dll", "dinput"},
    {"openal32.dll", "openal"},
    {"fmod.dll", "fmod"},
    {"fmodex.dll", "fmod"},

    // Video codecs
    {"binkw32.dll", "bink"},
    {"binkw64.dll", "bink"},
    {"bink2w32.dll", "bink2"},
    {"bink2w64.dll", "bink2"},

    // Physics
    {"physxloader.dll", "physx"},
    {"physx3_x86.dll", "physx"},
    {"physx3_x64.dll", "physx"},

    // GPU / VR
    {"openvr_api.dll", "openvr"},
    {"nvapi.dll", "dxvk_nvapi"},
    {"nvapi64.dll", "dxvk_nvapi"},

    // Store loaders
    {"ubiorbitapi_r2.dll", "ubisoftconnect"},
    {"uplay_r1.dll", "ubisoftconnect"},
    {"uplay_r1_loader.dll", "ubisoftconnect"},

    // .NET
    {"mscoree.dll", "dotnet40"},
    {"clr.dll", "dotnet40"},
    {"system.dll", "dotnet40"},

    // Visual C++ runtimes
    {"msvcp140.dll", "vcrun2019"},
    {"msvcp140_1.dll", "vcrun2019"},
    {"msvcp140_2.dll", "vcrun2019"},
    {"vcruntime140.dll", "vcrun2019"},
    {"vcruntime140_1.dll", "vcrun2019"},
    {"vcomp140.dll", "vcrun2019"},
    {"msvcp150.dll", "vcrun2022"},
    {"vcruntime150.dll", "vcrun2022"},
    {"vcomp150.dll", "vcrun2022"},
    {"msvcp60.dll", "vcrun6"},
    {"msvcrt.dll", "vcrun6"},
    {"msvcp71.dll", "vcrun2003"},
    {"msvcr71.dll", "vcrun2003"},
    {"msvcp80.dll", "vcrun2005"},
    {"msvcr80.dll", "vcrun2005"},
    {"msvcp90.dll", "vcrun2008"},
    {"msvcr90.dll", "vcrun2008"},
    {"msvcp100.dll", "vcrun2010"},
    {"msvcr100.dll", "vcrun2010"},
    {"msvcp110.dll", "vcrun2012"},
    {"msvcr110.dll", "vcrun2012"},
    {"msvcp120.dll", "vcrun2013"},
    {"msvcr120.dll", "vcrun2013"},

    // System libraries
    {"mfc42.dll", "mfc42"},
    {"msxml3.dll", "msxml3"},
    {"msxml6.dll", "msxml6"},
    {"quartz.dll", "quartz"},
    {"riched20.dll", "riched20"},
    {"tahoma.ttf", "tahoma"},
    {"arial.ttf", "corefonts"},
    {"winhttp.dll", "winhttp"},
    {"wininet.dll", "wininet"},
};

// Libraries every prefix already provides
const char* const BASE_LIBRARIES[] = {
    "advapi32.dll", "bcrypt.dll",   "comctl32.dll", "comdlg32.dll", "crypt32.dll",
    "dbghelp.dll",  "dwmapi.dll",   "gdi32.dll",    "hid.dll",      "imm32.dll",
    "iphlpapi.dll", "kernel32.dll", "ntdll.dll",    "ole32.dll",    "oleaut32.dll",
    "opengl32.dll", "powrprof.dll", "psapi.dll",    "secur32.dll",  "setupapi.dll",
    "shell32.dll",  "shlwapi.dll",  "user32.dll",   "userenv.dll",  "uxtheme.dll",
    "version.dll",  "winmm.dll",    "winspool.drv", "ws2_32.dll",   "wsock32.dll",
};

// Runtimes first, then frameworks and fonts, then graphics layers, then the rest
const char* const INSTALL_ORDER[] = {
    "vcrun6",   "vcrun2003", "vcrun2005",      "vcrun2008",      "vcrun2010", "vcrun2012",
    "vcrun2013", "vcrun2019", "vcrun2022",     "mfc42",          "dotnet40",  "corefonts",
    "tahoma",   "msxml3",    "msxml6",         "riched20",       "quartz",    "d3dx9",
    "d3dx10",   "d3dcompiler_43", "d3dcompiler_47", "dxvk",      "vkd3d",     "dxvk_nvapi",
    "xinput",   "dinput",    "openal",         "fmod",           "bink",      "bink2",
    "physx",    "openvr",    "winhttp",        "wininet",        "ubisoftconnect",
};

} // namespace

DependencyCatalog DependencyCatalog::builtin() {
    DependencyCatalog catalog;
    catalog.setVersion(BUILTIN_CATALOG_VERSION);

    for (const auto& m : INSTALLABLE) {
        catalog.add(m.library, m.component, ComponentSource::MustInstall);
    }
    for (const char* lib : BASE_LIBRARIES) {
        catalog.add(lib, BASE_RUNTIME, ComponentSource::BaseRuntime);
    }
    catalog.declareOrder(std::vector<std::string>(std::begin(INSTALL_ORDER), std::end(INSTALL_ORDER)));

    return catalog;
}

bool DependencyCatalog::add(const std::string& library, const std::string& component,
                            ComponentSource source) {
    std::string key = to_lower(trim(library));
    if (key.empty() || component.empty()) return false;
    if (map_.count(key) > 0) return false;

    map_.emplace(key, RuntimeComponent{component, source});
    return true;
}

std::optional<RuntimeComponent> DependencyCatalog::lookup(const std::string& library) const {
    auto it = map_.find(to_lower(trim(library)));
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

void DependencyCatalog::declareOrder(const std::vector<std::string>& components) {
    for (const auto& c : components) {
        if (order_index_.count(c) > 0) continue;
        order_index_[c] = order_.size();
        order_.push_back(c);
    }
}

size_t DependencyCatalog::rank(const std::string& component) const {
    auto it = order_index_.find(component);
    return it == order_index_.end() ? order_.size() : it->second;
}

void DependencyCatalog::sortByInstallOrder(std::vector<RuntimeComponent>& components) const {
    std::stable_sort(components.begin(), components.end(),
                     [this](const RuntimeComponent& a, const RuntimeComponent& b) {
                         size_t ra = rank(a.id);
                         size_t rb = rank(b.id);
                         if (ra != rb) return ra < rb;
                         return a.id < b.id;
                     });
}

CatalogExtensionResult extend_catalog(DependencyCatalog& catalog, const std::string& json_str) {
    CatalogExtensionResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (!j.contains("$schema") || !j["$schema"].is_string() ||
            trim(j["$schema"].get<std::string>()) != "cork.catalog.v1") {
            result.error = "$schema mismatch: expected cork.catalog.v1";
            return result;
        }

        if (j.contains("libraries") && j["libraries"].is_object()) {
            for (auto& [library, val] : j["libraries"].items()) {
                std::string component;
                ComponentSource source = ComponentSource::MustInstall;

                if (val.is_string()) {
                    component = val.get<std::string>();
                } else if (val.is_object() && val.contains("component") && val["component"].is_string()) {
                    component = val["component"].get<std::string>();
                    if (val.contains("provided_by") && val["provided_by"].is_string() &&
                        to_lower(val["provided_by"].get<std::string>()) == "base") {
                        source = ComponentSource::BaseRuntime;
                    }
                } else {
                    result.warnings.push_back("invalid_entry:" + library);
                    continue;
                }

                if (catalog.add(library, component, source)) {
                    ++result.added;
                } else {
                    result.warnings.push_back("already_mapped:" + library);
                }
            }
        }

        if (j.contains("install_order") && j["install_order"].is_array()) {
            std::vector<std::string> order;
            for (const auto& elem : j["install_order"]) {
                if (elem.is_string()) order.push_back(elem.get<std::string>());
            }
            catalog.declareOrder(order);
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    }
}

} // namespace cork
