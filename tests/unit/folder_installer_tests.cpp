#include <doctest/doctest.h>
#include <cork/folder_installer.hpp>

#include "test_support.hpp"

#include <filesystem>

using namespace cork;
using cork::test::InstallerHarness;
using cork::test::TempTestDir;

namespace fs = std::filesystem;

namespace {

using States = std::vector<std::string>;

std::string name_of(const Result<std::string>& r) {
    return fs::path(r.value()).filename().string();
}

} // namespace

TEST_CASE("longest_common_substring") {
    CHECK(longest_common_substring("witcher3", "thewitcher3wildhunt") == 8);
    CHECK(longest_common_substring("abc", "xyz") == 0);
    CHECK(longest_common_substring("", "abc") == 0);
    CHECK(longest_common_substring("launcher", "launch") == 6);
}

TEST_CASE("folder_name ignores trailing separators") {
    CHECK(folder_name("/data/GameFolder") == "GameFolder");
    CHECK(folder_name("/data/GameFolder/") == "GameFolder");
    CHECK(folder_name("relative/dir//") == "dir");
}

TEST_CASE("discover_launchable") {
    TempTestDir t;

    SUBCASE("closest name wins") {
        t.file("Witcher 3/bin/x64/witcher3.exe");
        t.file("Witcher 3/redkit/toolkit.exe");
        t.file("Witcher 3/unins000.exe");
        auto r = discover_launchable(t.path + "/Witcher 3", "Witcher 3");
        REQUIRE(r.isOk());
        CHECK(name_of(r) == "witcher3.exe");
    }

    SUBCASE("system directories are skipped") {
        t.file("g/windows/system32/game.exe");
        t.file("g/SysWOW64/game.exe");
        t.file("g/bin/other.exe");
        auto r = discover_launchable(t.path + "/g", "game");
        REQUIRE(r.isOk());
        CHECK(name_of(r) == "other.exe");
    }

    SUBCASE("helper binaries only as a last resort") {
        t.file("g/Game_Setup.exe");
        t.file("g/UnityCrashHandler64.exe");
        t.file("g/vcredist_x64.exe");
        t.file("g/engine.exe");
        auto r = discover_launchable(t.path + "/g", "Game");
        REQUIRE(r.isOk());
        CHECK(name_of(r) == "engine.exe");

        TempTestDir only;
        only.file("h/setup.exe");
        auto fallback = discover_launchable(only.path + "/h", "h");
        REQUIRE(fallback.isOk());
        CHECK(name_of(fallback) == "setup.exe");
    }

    SUBCASE("installer leftovers are skipped") {
        t.file("g/Installer/game.exe");
        t.file("g/temp_installer/game.exe");
        t.file("g/GameInst.exe");
        t.file("g/bin/runner.exe");
        auto r = discover_launchable(t.path + "/g", "game");
        REQUIRE(r.isOk());
        CHECK(name_of(r) == "runner.exe");
    }

    SUBCASE("ties keep the first path") {
        t.file("g/b/zeta.exe");
        t.file("g/a/alpha.exe");
        auto r = discover_launchable(t.path + "/g", "nothing");
        REQUIRE(r.isOk());
        CHECK(name_of(r) == "alpha.exe");
    }

    SUBCASE("extension case is ignored and separators normalized") {
        t.file("g/Half-Life.EXE");
        t.file("g/hl_tools.exe");
        auto r = discover_launchable(t.path + "/g", "half_life");
        REQUIRE(r.isOk());
        CHECK(name_of(r) == "Half-Life.EXE");
    }

    SUBCASE("no executables") {
        t.file("g/readme.txt");
        t.file("g/data/pak0.pak");
        auto r = discover_launchable(t.path + "/g", "g");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::DISCOVERY);
        CHECK(r.error().stage() == stage::DISCOVERY);
    }

    SUBCASE("missing root") {
        CHECK(discover_launchable(t.path + "/absent", "x").isErr());
    }
}

TEST_CASE("folder installer: copies, discovers and records a manual shortcut") {
    InstallerHarness h;
    h.dir.file("src/GameFolder/GameFolder.exe");
    h.dir.file("src/GameFolder/unins000.exe");
    h.dir.file("src/GameFolder/data/level1.dat");
    std::string source = h.dir.path + "/src/GameFolder";

    FolderInstaller installer(h.services());
    auto outcome = installer.run(h.context(source, TargetKind::Folder));

    REQUIRE(outcome.succeeded());
    CHECK(outcome.states == States{"Created", "EnvironmentReady", "Copied", "ExecutableDiscovered",
                                   "DependenciesResolved", "Executed", "ShortcutRecorded", "Done"});

    std::string destination = h.config.prefix_base + "/b/drive_c/GameFolder";
    CHECK(fs::exists(destination + "/data/level1.dat"));
    CHECK(h.gateway->count("copy:" + destination) == 1);

    REQUIRE(h.gateway->ran.size() == 1);
    CHECK(h.gateway->ran[0] == destination + "/GameFolder.exe");

    REQUIRE(outcome.shortcut.has_value());
    CHECK(outcome.shortcut->source == ShortcutSource::ManualRecord);
    CHECK(outcome.shortcut->display_name == "GameFolder");
    CHECK(outcome.shortcut->target_executable_path == destination + "/GameFolder.exe");

    auto stored = h.store->find("b", "GameFolder");
    REQUIRE(stored.has_value());
    CHECK(stored->target_executable_path == destination + "/GameFolder.exe");
    CHECK(h.gateway->count("add:") == 0);
}

TEST_CASE("folder installer: target subdirectory") {
    InstallerHarness h;
    h.dir.file("src/dl/bin/portal.exe");

    SUBCASE("custom") {
        auto ctx = h.context(h.dir.path + "/src/dl", TargetKind::Folder);
        ctx.request.target_subdir = "Games/Portal";
        auto outcome = FolderInstaller(h.services()).run(ctx);

        REQUIRE(outcome.succeeded());
        CHECK(outcome.shortcut->target_executable_path ==
              h.config.prefix_base + "/b/drive_c/Games/Portal/bin/portal.exe");
    }

    SUBCASE("escaping drive_c") {
        auto ctx = h.context(h.dir.path + "/src/dl", TargetKind::Folder);
        ctx.request.target_subdir = "../outside";
        auto outcome = FolderInstaller(h.services()).run(ctx);

        CHECK(outcome.states == States{"Created", "EnvironmentReady", "Failed"});
        REQUIRE(outcome.error.has_value());
        CHECK(outcome.error->code() == ErrorCode::STAGING);
        CHECK(outcome.error->stage() == stage::COPY);
        CHECK(h.gateway->count("copy:") == 0);
    }
}

TEST_CASE("folder installer: failures stop at their stage") {
    InstallerHarness h;
    h.dir.file("src/Game/game.exe");
    std::string source = h.dir.path + "/src/Game";

    SUBCASE("copy") {
        h.gateway->fail_copy = true;
        auto outcome = FolderInstaller(h.services()).run(h.context(source, TargetKind::Folder));
        CHECK(outcome.states == States{"Created", "EnvironmentReady", "Failed"});
        CHECK(outcome.error->code() == ErrorCode::STAGING);
        CHECK(outcome.error->stage() == stage::COPY);
    }

    SUBCASE("discovery") {
        h.dir.file("src/Empty/readme.txt");
        auto outcome = FolderInstaller(h.services()).run(h.context(h.dir.path + "/src/Empty", TargetKind::Folder));
        CHECK(outcome.states == States{"Created", "EnvironmentReady", "Copied", "Failed"});
        CHECK(outcome.error->code() == ErrorCode::DISCOVERY);
        CHECK(h.gateway->ran.empty());
    }

    SUBCASE("execution") {
        h.gateway->timeouts_remaining = 1;
        auto outcome = FolderInstaller(h.services()).run(h.context(source, TargetKind::Folder));
        CHECK(outcome.states.back() == "Failed");
        CHECK(outcome.error->code() == ErrorCode::EXECUTION);
        CHECK_FALSE(h.store->find("b", "game").has_value());
    }

    SUBCASE("shortcut record cannot be written") {
        // A regular file where the sidecar directory should be
        h.store = std::make_shared<ShortcutStore>(h.dir.file("blocked") + "/shortcuts");
        auto outcome = FolderInstaller(h.services()).run(h.context(source, TargetKind::Folder));

        CHECK(outcome.states == States{"Created", "EnvironmentReady", "Copied", "ExecutableDiscovered",
                                       "DependenciesResolved", "Executed", "Failed"});
        REQUIRE(outcome.error.has_value());
        CHECK(outcome.error->code() == ErrorCode::IO_ERROR);
        CHECK(outcome.error->stage() == stage::SHORTCUT);
        CHECK_FALSE(outcome.shortcut.has_value());
    }

    SUBCASE("native registry unavailable") {
        h.gateway->fail_list = true;
        auto outcome = FolderInstaller(h.services()).run(h.context(source, TargetKind::Folder));

        CHECK(outcome.states.back() == "Failed");
        REQUIRE(outcome.error.has_value());
        CHECK(outcome.error->stage() == stage::SHORTCUT);
        CHECK_FALSE(h.store->find("b", "game").has_value());
    }

    SUBCASE("cancelled before copy") {
        auto ctx = h.context(source, TargetKind::Folder);
        ctx.cancel.cancel();
        auto outcome = FolderInstaller(h.services()).run(ctx);
        CHECK(outcome.error->code() == ErrorCode::CANCELLED);
        CHECK(h.gateway->count("copy:") == 0);
    }
}
