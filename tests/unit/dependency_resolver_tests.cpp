#include <doctest/doctest.h>
#include <cork/dependency_resolver.hpp>

#include "test_support.hpp"

using namespace cork;
using cork::test::make_pe_image;
using cork::test::TempTestDir;

namespace {

std::shared_ptr<const DependencyCatalog> builtin_catalog() {
    return std::make_shared<const DependencyCatalog>(DependencyCatalog::builtin());
}

std::vector<std::string> ids(const std::vector<RuntimeComponent>& components) {
    std::vector<std::string> out;
    for (const auto& c : components) out.push_back(c.id);
    return out;
}

} // namespace

TEST_CASE("catalog: builtin lookups") {
    auto catalog = DependencyCatalog::builtin();
    CHECK(catalog.version() > 0);
    CHECK(catalog.size() > 50);

    auto d3d = catalog.lookup("d3dcompiler_47.dll");
    REQUIRE(d3d.has_value());
    CHECK(d3d->id == "d3dcompiler_47");
    CHECK(d3d->provided_by == ComponentSource::MustInstall);

    auto kernel = catalog.lookup("KERNEL32.DLL");
    REQUIRE(kernel.has_value());
    CHECK(kernel->provided_by == ComponentSource::BaseRuntime);

    CHECK_FALSE(catalog.lookup("foo.dll").has_value());
    CHECK(catalog.lookup("  DXGI.dll ")->id == "dxvk");
}

TEST_CASE("catalog: append-only") {
    DependencyCatalog catalog;
    CHECK(catalog.add("Foo.dll", "foo"));
    CHECK_FALSE(catalog.add("foo.DLL", "other"));
    CHECK(catalog.lookup("foo.dll")->id == "foo");
    CHECK_FALSE(catalog.add("", "x"));
    CHECK_FALSE(catalog.add("bar.dll", ""));
    CHECK(catalog.size() == 1);
}

TEST_CASE("catalog: install order") {
    DependencyCatalog catalog;
    catalog.declareOrder({"vcrun2019", "dxvk"});
    catalog.declareOrder({"dxvk", "xinput"});

    std::vector<RuntimeComponent> components = {
        {"zeta", ComponentSource::MustInstall},
        {"xinput", ComponentSource::MustInstall},
        {"alpha", ComponentSource::MustInstall},
        {"dxvk", ComponentSource::MustInstall},
        {"vcrun2019", ComponentSource::MustInstall},
    };
    catalog.sortByInstallOrder(components);
    CHECK(ids(components) == std::vector<std::string>{"vcrun2019", "dxvk", "xinput", "alpha", "zeta"});
}

TEST_CASE("catalog: extensions") {
    auto catalog = DependencyCatalog::builtin();
    size_t before = catalog.size();

    SUBCASE("adds new libraries") {
        auto r = extend_catalog(catalog, R"({
            "$schema": "cork.catalog.v1",
            "libraries": {
                "steam_api.dll": "steam",
                "mylib.dll": {"component": "wine", "provided_by": "base"},
                "d3dcompiler_47.dll": "something_else",
                "broken.dll": 42
            },
            "install_order": ["steam"]
        })");
        REQUIRE(r.ok);
        CHECK(r.added == 2);
        CHECK(catalog.size() == before + 2);
        CHECK(catalog.lookup("steam_api.dll")->id == "steam");
        CHECK(catalog.lookup("mylib.dll")->provided_by == ComponentSource::BaseRuntime);
        CHECK(catalog.lookup("d3dcompiler_47.dll")->id == "d3dcompiler_47");

        bool saw_mapped = false;
        bool saw_invalid = false;
        for (const auto& w : r.warnings) {
            if (w == "already_mapped:d3dcompiler_47.dll") saw_mapped = true;
            if (w == "invalid_entry:broken.dll") saw_invalid = true;
        }
        CHECK(saw_mapped);
        CHECK(saw_invalid);
    }

    SUBCASE("schema required") {
        auto r = extend_catalog(catalog, R"({"libraries": {"a.dll": "a"}})");
        CHECK_FALSE(r.ok);
        CHECK(catalog.size() == before);
    }

    SUBCASE("malformed json") {
        auto r = extend_catalog(catalog, "{not json");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("parse error") != std::string::npos);
    }
}

TEST_CASE("resolver: mapped and unmapped imports") {
    DependencyResolver resolver(builtin_catalog());
    auto report = resolver.resolveImports("game.exe", {"KERNEL32.dll", "d3dcompiler_47.dll", "foo.dll"});

    CHECK(report.binary_path == "game.exe");
    CHECK(report.detected_imports == std::set<std::string>{"kernel32.dll", "d3dcompiler_47.dll", "foo.dll"});
    CHECK(report.unresolved_imports == std::set<std::string>{"foo.dll"});
    REQUIRE(report.resolved_components.size() == 2);

    auto plan = resolver.installPlan(report);
    CHECK(ids(plan) == std::vector<std::string>{"d3dcompiler_47"});
}

TEST_CASE("resolver: imports are case-insensitive and deduplicated") {
    DependencyResolver resolver(builtin_catalog());
    auto report = resolver.resolveImports("x.exe", {"DXGI.DLL", "dxgi.dll", "d3d11.dll", "MSVCP140.dll",
                                                    "vcruntime140.dll"});

    CHECK(report.detected_imports.size() == 4);
    CHECK(ids(report.resolved_components) == std::vector<std::string>{"vcrun2019", "dxvk"});
    CHECK(report.unresolved_imports.empty());
}

TEST_CASE("resolver: same imports give the same report") {
    DependencyResolver resolver(builtin_catalog());
    auto a = resolver.resolveImports("x.exe", {"xinput1_3.dll", "d3d9.dll", "msvcr100.dll", "bar.dll"});
    auto b = resolver.resolveImports("x.exe", {"bar.dll", "msvcr100.dll", "d3d9.dll", "xinput1_3.dll"});

    CHECK(a.detected_imports == b.detected_imports);
    CHECK(a.resolved_components == b.resolved_components);
    CHECK(a.unresolved_imports == b.unresolved_imports);
    CHECK(ids(a.resolved_components) == std::vector<std::string>{"vcrun2010", "d3dx9", "xinput"});
}

TEST_CASE("resolver: install plan adds extras once, in order") {
    DependencyResolver resolver(builtin_catalog());
    auto report = resolver.resolveImports("x.exe", {"dxgi.dll", "user32.dll"});
    auto plan = resolver.installPlan(report, {"vcrun2019", "dxvk", "d3dx9", ""});
    CHECK(ids(plan) == std::vector<std::string>{"vcrun2019", "d3dx9", "dxvk"});
}

TEST_CASE("resolver: scans binaries on disk") {
    TempTestDir t;
    DependencyResolver resolver(builtin_catalog());

    SUBCASE("PE image") {
        std::string exe = t.file("game.exe", make_pe_image({"KERNEL32.dll", "d3dcompiler_47.dll", "foo.dll"},
                                                           {"xinput1_3.dll"}));
        auto report = resolver.resolve(exe);
        CHECK(report.warnings.empty());
        CHECK(report.unresolved_imports == std::set<std::string>{"foo.dll"});
        CHECK(ids(report.resolved_components) ==
              std::vector<std::string>{"d3dcompiler_47", "xinput", "wine"});
    }

    SUBCASE("unreadable binary") {
        auto report = resolver.resolve(t.file("notes.exe", "plain text"));
        CHECK(report.detected_imports.empty());
        CHECK(report.resolved_components.empty());
        REQUIRE(report.warnings.size() == 1);
        CHECK(report.warnings[0].rfind("import_scan_failed:", 0) == 0);
    }
}
