// Command-line settings and asset paths

#include <catch2/catch_test_macros.hpp>
#include <Core/AssetPath.hpp>
#include <Core/Settings.hpp>
#include <raylib.h>
#include <string>
#include <vector>

using namespace Kindling;

static GameSettings Parse(std::vector<std::string> args, GameSettings defaults = {})
{
    args.insert(args.begin(), "kindling");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return ParseCommandLine((int)argv.size(), argv.data(), defaults);
}

TEST_CASE("Command line parsing", "[settings]") {
    SECTION("no arguments keep the defaults") {
        GameSettings s = Parse({});
        REQUIRE(s.width == 1280);
        REQUIRE(s.height == 720);
        REQUIRE_FALSE(s.headless);
        REQUIRE(s.dataDir == ".");
    }

    SECTION("window and loop options") {
        GameSettings s = Parse({ "--width", "800", "--height", "600", "--fps", "30",
                                 "--headless", "--frames", "120", "--title", "Demo" });
        REQUIRE(s.width == 800);
        REQUIRE(s.height == 600);
        REQUIRE(s.targetFPS == 30);
        REQUIRE(s.headless);
        REQUIRE(s.maxFrames == 120);
        REQUIRE(s.title == "Demo");
    }

    SECTION("paths and log level") {
        GameSettings s = Parse({ "--data-dir", "/tmp/saves", "--script", "game.lua", "--log-level", "debug" });
        REQUIRE(s.dataDir == "/tmp/saves");
        REQUIRE(s.scriptPath == "game.lua");
        REQUIRE(s.logLevel == LOG_DEBUG);
    }

    SECTION("bad values are ignored") {
        GameSettings defaults;
        defaults.title = "Kept";
        GameSettings s = Parse({ "--width", "wide", "--log-level", "loud", "--bogus" }, defaults);
        REQUIRE(s.width == 1280);
        REQUIRE(s.logLevel == defaults.logLevel);
        REQUIRE(s.title == "Kept");
    }

    SECTION("out-of-range numbers are ignored") {
        GameSettings s = Parse({ "--width", "99999999999", "--height", "-99999999999", "--frames", "3" });
        REQUIRE(s.width == 1280);
        REQUIRE(s.height == 720);
        REQUIRE(s.maxFrames == 3);
    }

    SECTION("negative rates clamp") {
        GameSettings s = Parse({ "--fps", "-5", "--frames", "-1" });
        REQUIRE(s.targetFPS == 0);
        REQUIRE(s.maxFrames == 0);
    }
}

TEST_CASE("Log level names", "[settings]") {
    REQUIRE(ParseLogLevel("warning") == LOG_WARNING);
    REQUIRE(ParseLogLevel("ERROR") == LOG_ERROR);
    REQUIRE(ParseLogLevel("none") == LOG_NONE);
    REQUIRE(ParseLogLevel("chatty") == -1);
}

TEST_CASE("Asset paths", "[settings][assets]") {
    REQUIRE(ResolveAssetPath("").empty());
    REQUIRE(ResolveAssetPath("/abs/file.png") == "/abs/file.png");

    REQUIRE_FALSE(ExecutableDirectory().empty());
    std::string resolved = ResolveAssetPath("Resources/skybox_texture.png");
    REQUIRE(resolved.rfind(ExecutableDirectory(), 0) == 0);
    REQUIRE(resolved.find("Resources/skybox_texture.png") != std::string::npos);
}
