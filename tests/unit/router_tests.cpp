#include <doctest/doctest.h>
#include <cork/file_installer.hpp>
#include <cork/folder_installer.hpp>
#include <cork/router.hpp>

#include "test_support.hpp"

using namespace cork;
using cork::test::TempTestDir;

namespace {

InstallRequest request_for(const std::string& path, DeclaredKind kind = DeclaredKind::Unknown) {
    InstallRequest r;
    r.target_path = path;
    r.declared_kind = kind;
    return r;
}

} // namespace

TEST_CASE("classify: missing path is invalid") {
    TempTestDir t;
    auto c = classify_target(request_for(t.path + "/nope/setup.exe"));
    CHECK(c.kind == TargetKind::Invalid);
    CHECK(c.reason == "path not found");

    CHECK(classify_target(request_for("")).kind == TargetKind::Invalid);
}

TEST_CASE("classify: directories are folders whatever the hint") {
    TempTestDir t;
    std::string dir = t.dir("GameFolder");

    SUBCASE("declared file") {
        auto c = classify_target(request_for(dir, DeclaredKind::File));
        CHECK(c.kind == TargetKind::Folder);
        CHECK(c.reason.find("overrides hint 'file'") != std::string::npos);
    }
    SUBCASE("declared folder") {
        auto c = classify_target(request_for(dir, DeclaredKind::Folder));
        CHECK(c.kind == TargetKind::Folder);
        CHECK(c.reason == "directory");
    }
    SUBCASE("exe hint") {
        auto r = request_for(dir);
        r.strategy_hint = StrategyHint::Executable;
        CHECK(classify_target(r).kind == TargetKind::Folder);
    }
    SUBCASE("trailing separator") {
        CHECK(classify_target(request_for(dir + "/")).kind == TargetKind::Folder);
    }
    SUBCASE("directory named like an installer") {
        std::string odd = t.dir("trap.exe");
        CHECK(classify_target(request_for(odd, DeclaredKind::File)).kind == TargetKind::Folder);
    }
}

TEST_CASE("classify: installer extensions") {
    TempTestDir t;
    CHECK(classify_target(request_for(t.file("a/setup.exe"))).kind == TargetKind::Executable);
    CHECK(classify_target(request_for(t.file("a/SETUP.EXE"))).kind == TargetKind::Executable);
    CHECK(classify_target(request_for(t.file("a/pkg.msi"))).kind == TargetKind::Executable);
    CHECK(classify_target(request_for(t.file("a/disc.iso"))).kind == TargetKind::DiskImage);
    CHECK(classify_target(request_for(t.file("a/Disc.Iso"))).kind == TargetKind::DiskImage);

    // A folder hint never turns a file into a folder
    auto c = classify_target(request_for(t.file("b/game.exe"), DeclaredKind::Folder));
    CHECK(c.kind == TargetKind::Executable);
    CHECK(c.reason.find("overrides") != std::string::npos);
}

TEST_CASE("classify: other files are unrecognized") {
    TempTestDir t;
    for (const char* name : {"readme.txt", "archive.zip", "noext", "game.exe.bak"}) {
        auto c = classify_target(request_for(t.file(name)));
        CHECK(c.kind == TargetKind::Invalid);
        CHECK(c.reason == "unrecognized file type");
    }
}

TEST_CASE("router selects installer by kind") {
    CorkConfig config = default_config();
    InstallerServices services{nullptr, nullptr, nullptr, config};
    auto file = std::make_shared<FileInstaller>(services);
    auto folder = std::make_shared<FolderInstaller>(services);
    StrategyRouter router(file, folder);

    CHECK(router.select({TargetKind::Executable, ""}) == file);
    CHECK(router.select({TargetKind::DiskImage, ""}) == file);
    CHECK(router.select({TargetKind::Folder, ""}) == folder);
    CHECK(router.select({TargetKind::Invalid, ""}) == nullptr);
}
