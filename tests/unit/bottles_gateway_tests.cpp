#include <doctest/doctest.h>
#include <cork/bottles_gateway.hpp>
#include <cork/platform.hpp>

#include "test_support.hpp"

#include <filesystem>

using namespace cork;
using cork::test::TempTestDir;
using cork::test::test_config;

namespace fs = std::filesystem;

namespace {

/// Gateway whose tools are shell scripts that append their arguments to log.txt
struct ScriptedTools {
    TempTestDir dir;
    CorkConfig config = test_config(dir.path);
    std::string log = dir.path + "/log.txt";

    ScriptedTools() {
        config.timeouts.default_seconds = 5;
        config.timeouts.wineserver_wait = 5;

        std::string bottles = dir.script("bin/bottles-cli",
            "echo \"bottles $*\" >> '" + log + "'\n"
            "case \"$1\" in\n"
            "  new)\n"
            "    case \"$3\" in\n"
            "      broken) echo 'Traceback' >&2; echo 'boom' >&2; exit 2 ;;\n"
            "      existing) mkdir -p '" + config.prefix_base + "'/\"$3\"; echo 'Bottle already exists' >&2; exit 1 ;;\n"
            "      ghost) exit 0 ;;\n"
            "    esac\n"
            "    mkdir -p '" + config.prefix_base + "'/\"$3\"/drive_c ;;\n"
            "  run)\n"
            "    case \"$5\" in\n"
            "      *slow.exe) sleep 10 ;;\n"
            "      *crash.exe) echo 'wine: Unhandled page fault' >&2; exit 5 ;;\n"
            "    esac ;;\n"
            "  --json)\n"
            "    printf '%s\\n' '[{\"name\": \"Game\", \"path\": \"C:\\\\Games\\\\game.exe\"}, {\"name\": \"\"}]' ;;\n"
            "  add)\n"
            "    [ \"$5\" = \"Refused\" ] && exit 1 ;;\n"
            "esac\n"
            "exit 0\n");

        std::string winetricks = dir.script("bin/winetricks",
            "echo \"winetricks $* prefix=$WINEPREFIX\" >> '" + log + "'\n"
            "case \"$2\" in\n"
            "  d3dx9) echo 'd3dx9 already installed, skipping'; exit 1 ;;\n"
            "  badverb) echo 'Unknown arg badverb' >&2; exit 1 ;;\n"
            "esac\n"
            "exit 0\n");

        std::string wineserver = dir.script("bin/wineserver",
            "echo \"wineserver $* prefix=$WINEPREFIX\" >> '" + log + "'\n"
            "exit 0\n");

        std::string wine = dir.script("bin/wine",
            "echo \"wine $* prefix=$WINEPREFIX\" >> '" + log + "'\n"
            "case \"$WINEPREFIX\" in\n"
            "  */flaky) echo 'wineboot: cannot start' >&2; exit 3 ;;\n"
            "esac\n"
            "exit 0\n");

        std::string extractor = dir.script("bin/7z",
            "echo \"7z $*\" >> '" + log + "'\n"
            "out=\"${3#-o}\"\n"
            "case \"$2\" in\n"
            "  *corrupt.iso) echo 'ERROR: Data Error' >&2; exit 2 ;;\n"
            "  *empty.iso) mkdir -p \"$out\"; exit 0 ;;\n"
            "esac\n"
            "mkdir -p \"$out/DISC1\"\n"
            "touch \"$out/readme.txt\" \"$out/DISC1/Setup.EXE\"\n"
            "exit 0\n");

        config.commands.bottles_cli = {bottles};
        config.commands.wine = {wine};
        config.commands.winetricks = {winetricks};
        config.commands.wineserver = {wineserver};
        config.commands.extractor = {extractor};
    }

    std::string logged() const { return read_file(log).value_or(""); }

    size_t lines(const std::string& needle) const {
        std::string text = logged();
        size_t n = 0;
        for (size_t at = text.find(needle); at != std::string::npos; at = text.find(needle, at + 1)) ++n;
        return n;
    }
};

} // namespace

TEST_CASE("bottles gateway: ensureEnvironment") {
    ScriptedTools tools;
    BottlesGateway gateway(tools.config);

    SUBCASE("creates once, then reuses") {
        auto first = gateway.ensureEnvironment("Game");
        REQUIRE(first.isOk());
        CHECK(first.value().created);
        CHECK(first.value().prefix_path == tools.config.prefix_base + "/Game");
        CHECK(tools.logged().find("bottles new --bottle-name Game --environment gaming") != std::string::npos);

        auto second = gateway.ensureEnvironment("Game");
        REQUIRE(second.isOk());
        CHECK_FALSE(second.value().created);
        CHECK(tools.lines("bottles new") == 1);
    }

    SUBCASE("new prefixes are repaired once") {
        REQUIRE(gateway.ensureEnvironment("Game").isOk());
        REQUIRE(gateway.ensureEnvironment("Game").isOk());
        CHECK(tools.lines("wine wineboot --repair prefix=" + tools.config.prefix_base + "/Game") == 1);
    }

    SUBCASE("failed repair does not fail creation") {
        auto r = gateway.ensureEnvironment("flaky");
        REQUIRE(r.isOk());
        CHECK(r.value().created);
        CHECK(tools.lines("wine wineboot --repair") == 1);
    }

    SUBCASE("already exists is not an error") {
        auto r = gateway.ensureEnvironment("existing");
        REQUIRE(r.isOk());
        CHECK_FALSE(r.value().created);
        CHECK(tools.lines("wine ") == 0);
    }

    SUBCASE("failure carries the last diagnostic line") {
        auto r = gateway.ensureEnvironment("broken");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::ENVIRONMENT);
        CHECK(r.error().stage() == stage::ENVIRONMENT);
        CHECK(r.error().message().find("exit code 2: boom") != std::string::npos);
    }

    SUBCASE("prefix must exist afterwards") {
        auto r = gateway.ensureEnvironment("ghost");
        REQUIRE(r.isErr());
        CHECK(r.error().message().find("not found") != std::string::npos);
    }
}

TEST_CASE("bottles gateway: installComponent") {
    ScriptedTools tools;
    BottlesGateway gateway(tools.config);

    CHECK(gateway.installComponent("Game", "vcrun2019").isOk());
    CHECK(tools.logged().find("winetricks -q vcrun2019 prefix=" + tools.config.prefix_base + "/Game") !=
          std::string::npos);

    CHECK(gateway.installComponent("Game", "d3dx9").isOk());

    auto failed = gateway.installComponent("Game", "badverb");
    REQUIRE(failed.isErr());
    CHECK(failed.error().code() == ErrorCode::DEPENDENCY_INSTALL);
    CHECK(failed.error().stage() == stage::DEPENDENCIES);
    CHECK(failed.error().message().find("badverb") != std::string::npos);
}

TEST_CASE("bottles gateway: runBinary") {
    ScriptedTools tools;
    BottlesGateway gateway(tools.config);

    SUBCASE("success waits for the wineserver") {
        auto r = gateway.runBinary("Game", "/games/game.exe", std::chrono::seconds(5));
        REQUIRE(r.isOk());
        CHECK(r.value() == 0);
        CHECK(tools.logged().find("bottles run -b Game -e /games/game.exe") != std::string::npos);
        CHECK(tools.lines("wineserver --wait prefix=" + tools.config.prefix_base + "/Game") == 1);
    }

    SUBCASE("timeout") {
        auto r = gateway.runBinary("Game", "/games/slow.exe", std::chrono::seconds(1));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::EXECUTION);
        CHECK(r.error().message().find("timed out") != std::string::npos);
    }

    SUBCASE("non-zero exit") {
        auto r = gateway.runBinary("Game", "/games/crash.exe", std::chrono::seconds(5));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::EXECUTION);
        CHECK(r.error().message().find("page fault") != std::string::npos);
    }
}

TEST_CASE("bottles gateway: mountImage") {
    ScriptedTools tools;
    BottlesGateway gateway(tools.config);

    SUBCASE("extracts and finds the installer") {
        std::string iso = tools.dir.file("media/game.iso");
        auto r = gateway.mountImage("Game", iso);
        REQUIRE(r.isOk());
        CHECK(r.value() == tools.config.staging_dir + "/Game/game/DISC1/Setup.EXE");
        CHECK(tools.logged().find("7z x " + iso + " -o" + tools.config.staging_dir + "/Game/game -y") !=
              std::string::npos);
    }

    SUBCASE("same image name in two bottles") {
        auto first = gateway.mountImage("alpha", tools.dir.file("a/game.iso"));
        REQUIRE(first.isOk());
        auto second = gateway.mountImage("beta", tools.dir.file("b/game.iso"));
        REQUIRE(second.isOk());

        CHECK(first.value() != second.value());
        CHECK(fs::exists(first.value()));
        CHECK(fs::exists(second.value()));
    }

    SUBCASE("missing image") {
        auto r = gateway.mountImage("Game", tools.dir.path + "/nope.iso");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::STAGING);
        CHECK(tools.lines("7z") == 0);
    }

    SUBCASE("extractor failure") {
        auto r = gateway.mountImage("Game", tools.dir.file("media/corrupt.iso"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::STAGING);
        CHECK(r.error().message().find("Data Error") != std::string::npos);
    }

    SUBCASE("no installer inside") {
        auto r = gateway.mountImage("Game", tools.dir.file("media/empty.iso"));
        REQUIRE(r.isErr());
        CHECK(r.error().stage() == stage::STAGING);
    }
}

TEST_CASE("bottles gateway: copyTree") {
    ScriptedTools tools;
    BottlesGateway gateway(tools.config);
    tools.dir.file("src/Game/game.exe");
    tools.dir.file("src/Game/data/a.pak");

    std::string dest = tools.config.prefix_base + "/b/drive_c/Game";
    REQUIRE(gateway.copyTree(tools.dir.path + "/src/Game", dest).isOk());
    CHECK(fs::exists(dest + "/game.exe"));
    CHECK(fs::exists(dest + "/data/a.pak"));

    // Copying again overwrites in place
    CHECK(gateway.copyTree(tools.dir.path + "/src/Game", dest).isOk());

    auto missing = gateway.copyTree(tools.dir.path + "/src/Nothing", dest);
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::STAGING);
    CHECK(missing.error().stage() == stage::COPY);
}

TEST_CASE("bottles gateway: native shortcuts") {
    ScriptedTools tools;
    BottlesGateway gateway(tools.config);

    auto listed = gateway.listNativeShortcuts("Game");
    REQUIRE(listed.isOk());
    REQUIRE(listed.value().size() == 1);
    CHECK(listed.value()[0].display_name == "Game");
    CHECK(listed.value()[0].target_executable_path == "C:\\Games\\game.exe");
    CHECK(listed.value()[0].bottle_name == "Game");

    CHECK(gateway.createNativeShortcut("Game", "Launcher", "/p/launcher.exe").isOk());
    CHECK(tools.logged().find("bottles add -b Game -n Launcher -p /p/launcher.exe") != std::string::npos);

    auto refused = gateway.createNativeShortcut("Game", "Refused", "/p/x.exe");
    REQUIRE(refused.isErr());
    CHECK(refused.error().stage() == stage::SHORTCUT);

    CHECK(gateway.storagePath("Game") == tools.config.prefix_base + "/Game");
}

TEST_CASE("parse_program_list formats") {
    SUBCASE("array") {
        auto r = parse_program_list("b", R"([{"name": "A", "path": "C:\\a.exe"}])");
        REQUIRE(r.isOk());
        REQUIRE(r.value().size() == 1);
        CHECK(r.value()[0].source == ShortcutSource::EnvironmentNative);
    }
    SUBCASE("wrapped") {
        auto r = parse_program_list("b", R"({"programs": [{"name": "A", "executable": "a.exe"}]})");
        REQUIRE(r.isOk());
        CHECK(r.value()[0].target_executable_path == "a.exe");
    }
    SUBCASE("id map") {
        auto r = parse_program_list("b", R"({"1f2e": {"name": "A", "path": "a.exe"}, "9c": {"name": "B"}})");
        REQUIRE(r.isOk());
        CHECK(r.value().size() == 2);
    }
    SUBCASE("empty output") {
        auto r = parse_program_list("b", "  \n");
        REQUIRE(r.isOk());
        CHECK(r.value().empty());
    }
    SUBCASE("garbage") {
        auto r = parse_program_list("b", "Bottle not found");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::IO_ERROR);
    }
}

TEST_CASE("find_image_installer") {
    TempTestDir t;

    SUBCASE("top level by priority") {
        t.file("img/start.exe");
        t.file("img/AUTORUN.EXE");
        t.file("img/sub/setup.exe");
        CHECK(fs::path(find_image_installer(t.path + "/img")).filename().string() == "AUTORUN.EXE");
    }
    SUBCASE("one level down") {
        t.file("img/a/readme.txt");
        t.file("img/b/install.exe");
        CHECK(find_image_installer(t.path + "/img") == t.path + "/img/b/install.exe");
    }
    SUBCASE("deeper trees are ignored") {
        t.file("img/a/b/setup.exe");
        CHECK(find_image_installer(t.path + "/img").empty());
    }
    SUBCASE("missing root") {
        CHECK(find_image_installer(t.path + "/none").empty());
    }
}
