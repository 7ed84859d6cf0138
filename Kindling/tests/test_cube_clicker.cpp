// Cube clicker example: persistence, HUD and clicking

#include "TestGame.hpp"
#include "GameManager.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <Engine/GameExtensions.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace Kindling;
using namespace CubeClicker;
using Catch::Matchers::WithinAbs;
namespace fs = std::filesystem;
namespace GX = Kindling::GameExtensions;

// Fresh, empty directory removed again when the test ends.
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / ("kindling_" + name))
    {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }
};

TEST_CASE("Click counters", "[cubeclicker][persistence]") {
    TempDir dir("clicks");
    ClickDataManager clicks(dir.str());

    REQUIRE(clicks.GetClickables().size() == 2);
    REQUIRE(clicks.Find(MouseButtonType::Left)->ToString() == "Left Clicks: 0");

    SECTION("no file is not an error") {
        REQUIRE_FALSE(clicks.TryLoad());
    }

    SECTION("save and load") {
        clicks.Find(MouseButtonType::Left)->count  = 3;
        clicks.Find(MouseButtonType::Right)->count = 1;
        clicks.Save();
        REQUIRE(fs::exists(dir.path / ClickDataManager::FileName));

        ClickDataManager reloaded(dir.str());
        REQUIRE(reloaded.TryLoad());
        REQUIRE(reloaded.Find(MouseButtonType::Left)->count == 3);
        REQUIRE(reloaded.Find(MouseButtonType::Right)->ToString() == "Right Clicks: 1");
    }

    SECTION("delete resets the counters") {
        clicks.Find(MouseButtonType::Left)->count = 5;
        clicks.Save();
        clicks.Delete();
        REQUIRE_FALSE(fs::exists(clicks.FilePath()));
        REQUIRE(clicks.Find(MouseButtonType::Left)->count == 0);
        REQUIRE_NOTHROW(clicks.Delete());
    }

    SECTION("malformed files throw") {
        std::ofstream(clicks.FilePath()) << "{ not json";
        REQUIRE_THROWS(clicks.TryLoad());

        std::ofstream(clicks.FilePath(), std::ios::trunc) << R"({"type":"Left"})";
        REQUIRE_THROWS(clicks.TryLoad());
    }

    SECTION("a half-parsed file keeps the old counters") {
        clicks.Find(MouseButtonType::Left)->count = 4;
        std::ofstream(clicks.FilePath()) << R"([{"type":"Left","count":9},{"type":1,"count":2}])";
        REQUIRE_THROWS(clicks.TryLoad());
        REQUIRE(clicks.Find(MouseButtonType::Left)->count == 4);
        REQUIRE(clicks.Find(MouseButtonType::Right)->count == 0);
    }
}

TEST_CASE("Cube positions", "[cubeclicker][persistence]") {
    TempDir dir("cubes");
    CubeDataManager cubes(dir.str());

    REQUIRE(cubes.LoadData().empty());

    cubes.UpdatePositions({ { 0, 0.5f, 0 }, { 1, 2, 3 } });
    cubes.SaveData();

    CubeDataManager reloaded(dir.str());
    auto positions = reloaded.LoadData();
    REQUIRE(positions.size() == 2);
    REQUIRE(positions[1].z == 3.0f);
    REQUIRE(reloaded.GetPositions().size() == 2);

    TempDir empty("cubes-empty");
    CubeDataManager missing(empty.str());
    missing.UpdatePositions({ { 4, 5, 6 } });
    REQUIRE(missing.LoadData().empty());
    REQUIRE(missing.GetPositions().empty());

    reloaded.DeleteData();
    REQUIRE(reloaded.GetPositions().empty());
    REQUIRE_FALSE(fs::exists(reloaded.FilePath()));
}

// Runs the manager the way the example does: 3D base scene plus the manager entity.
static GameManager* StartCubeClicker(Game& game, const std::string& dataDir)
{
    auto manager = std::make_shared<GameManager>(dataDir);
    GameManager* raw = manager.get();

    GX::Schedule(game, [&game, manager](Scene& scene) {
        GX::SetupBase3DScene(game);
        auto entity = std::make_shared<Entity>("GameManager");
        entity->Add(manager);
        scene.Add(std::move(entity));
    });
    return raw;
}

TEST_CASE("GameManager", "[cubeclicker]") {
    TempDir dir("manager");
    Game game(HeadlessSettings());
    Scene& scene = game.GetRootScene();
    GameManager* manager = StartCubeClicker(game, dir.str());
    REQUIRE(game.Tick());

    SECTION("start builds the HUD and the first cube") {
        REQUIRE(scene.Count(UIEntityName) == 1);
        REQUIRE(scene.FindFirst(UIEntityName)->Get<UI::UIComponent>() != nullptr);
        REQUIRE(scene.Count(CubeEntityName) == 1);
        REQUIRE(manager->GetMessage() == GameManager::IntroMessage);
        REQUIRE(manager->GetClickText(MouseButtonType::Left) == "Left Clicks: 0");
        REQUIRE(manager->GetButton("Load Data") != nullptr);
        REQUIRE(manager->GetButton("Save Data") != nullptr);
        REQUIRE(manager->GetButton("Delete Data") != nullptr);
        REQUIRE(manager->GetButton("Quit") == nullptr);
    }

    SECTION("left click spawns a cube above") {
        Entity* cube = scene.FindFirst(CubeEntityName);
        Entity* spawned = manager->ClickCube(game, cube, MouseButtonType::Left);
        REQUIRE(spawned != nullptr);
        REQUIRE(spawned->transform.position.y > cube->transform.position.y + 1.0f);
        REQUIRE(scene.Count(CubeEntityName) == 2);
        REQUIRE(manager->GetClickText(MouseButtonType::Left) == "Left Clicks: 1");
        REQUIRE(manager->Cubes().GetPositions().size() == 2);
    }

    SECTION("right click removes the cube") {
        Entity* cube = scene.FindFirst(CubeEntityName);
        REQUIRE(manager->ClickCube(game, cube, MouseButtonType::Right) == nullptr);
        REQUIRE(scene.Count(CubeEntityName) == 0);
        REQUIRE(manager->GetClickText(MouseButtonType::Right) == "Right Clicks: 1");
        REQUIRE(manager->Cubes().GetPositions().empty());
    }

    SECTION("clicks on anything else are ignored") {
        Entity* ground = scene.FindFirst(GX::DefaultGroundName);
        REQUIRE(manager->ClickCube(game, ground, MouseButtonType::Right) == nullptr);
        REQUIRE(scene.Count(GX::DefaultGroundName) == 1);
        REQUIRE(manager->GetClickText(MouseButtonType::Right) == "Right Clicks: 0");
    }

    SECTION("buttons save, load and delete") {
        Entity* cube = scene.FindFirst(CubeEntityName);
        manager->ClickCube(game, cube, MouseButtonType::Left);
        manager->ClickCube(game, cube, MouseButtonType::Left);

        manager->GetButton("Save Data")->Click();
        REQUIRE(manager->GetMessage() == "Data saved. Keep clicking.");
        REQUIRE(fs::exists(dir.path / ClickDataManager::FileName));
        REQUIRE(fs::exists(dir.path / CubeDataManager::FileName));

        manager->Clicks().Find(MouseButtonType::Left)->count = 0;
        manager->GetButton("Load Data")->Click();
        REQUIRE(manager->GetMessage() == "Data loaded. Start clicking.");
        REQUIRE(manager->GetClickText(MouseButtonType::Left) == "Left Clicks: 2");
        REQUIRE(manager->reloadCubes);

        REQUIRE(game.Tick());
        REQUIRE_FALSE(manager->reloadCubes);
        REQUIRE(scene.Count(CubeEntityName) == 3);

        manager->GetButton("Delete Data")->Click();
        REQUIRE(manager->GetMessage() == "Data deleted.");
        REQUIRE(manager->GetClickText(MouseButtonType::Left) == "Left Clicks: 0");
        REQUIRE_FALSE(fs::exists(dir.path / ClickDataManager::FileName));
    }

    SECTION("loading without data restores a single cube") {
        manager->ClickCube(game, scene.FindFirst(CubeEntityName), MouseButtonType::Left);
        REQUIRE(manager->Cubes().GetPositions().size() == 2);
        manager->LoadData();
        REQUIRE(manager->GetMessage() == "No click data found.");
        REQUIRE(manager->Cubes().GetPositions().empty());
        REQUIRE(game.Tick());
        REQUIRE(scene.Count(CubeEntityName) == 1);
    }

    SECTION("malformed data is reported, not thrown") {
        manager->ClickCube(game, scene.FindFirst(CubeEntityName), MouseButtonType::Left);
        std::ofstream(dir.path / ClickDataManager::FileName) << "[{\"type\": 1}]";
        std::ofstream(dir.path / CubeDataManager::FileName) << "nope";
        REQUIRE_NOTHROW(manager->LoadData());
        REQUIRE(manager->GetMessage() == "No click data found.");
        REQUIRE(manager->Cubes().GetPositions().empty());
        REQUIRE(manager->GetClickText(MouseButtonType::Left) == "Left Clicks: 1");
        REQUIRE(game.Tick());
        REQUIRE(scene.Count(CubeEntityName) == 1);
    }
}

TEST_CASE("Clicking a cube on screen", "[cubeclicker][input]") {
    TempDir dir("screen");
    Game game(HeadlessSettings());
    Scene& scene = game.GetRootScene();
    GameManager* manager = StartCubeClicker(game, dir.str());
    REQUIRE(game.Tick());

    CameraComponent* camera = nullptr;
    scene.ForEach<CameraComponent>([&](Entity&, CameraComponent& c) { if (!camera) camera = &c; });
    REQUIRE(camera != nullptr);

    Entity* cube = scene.FindFirst(CubeEntityName);
    Vector2 onScreen = GetWorldToScreenEx(cube->WorldPosition(), camera->ToCamera3D(),
                                          game.ScreenWidth(), game.ScreenHeight());

    ScriptedInputOf(game).Click(MOUSE_BUTTON_LEFT, onScreen);
    REQUIRE(game.Tick());
    REQUIRE(scene.Count(CubeEntityName) == 2);
    REQUIRE(manager->GetClickText(MouseButtonType::Left) == "Left Clicks: 1");

    ScriptedInputOf(game).Click(MOUSE_BUTTON_RIGHT, { 2.0f, 2.0f });
    REQUIRE(game.Tick());
    REQUIRE(manager->GetClickText(MouseButtonType::Right) == "Right Clicks: 0");
}
