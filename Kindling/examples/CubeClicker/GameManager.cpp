#include "GameManager.hpp"
#include <Engine/GameExtensions.hpp>
#include <raylib.h>
#include <raymath.h>
#include <exception>

using namespace Kindling;

namespace CubeClicker {

static constexpr Color   GridBackground = { 248, 177, 149, 100 };
static constexpr Vector3 FirstCubePosition = { 0.0f, 0.5f, 0.0f };
static constexpr float   SpawnHeight = 1.5f;

static std::shared_ptr<UI::TextBlock> MakeTextBlock(const std::string& text, int size)
{
    auto block    = std::make_shared<UI::TextBlock>(text, size);
    block->color  = WHITE;
    block->margin = { 3, 0, 3, 0 };
    return block;
}

static std::shared_ptr<UI::Button> MakeButton(const std::string& title)
{
    auto button                 = std::make_shared<UI::Button>(title);
    button->name                = title;
    button->fontSize            = 14;
    button->background          = { 0, 0, 0, 200 };
    button->padding             = { 5, 5, 5, 5 };
    button->width               = 104;
    button->margin              = { 0, 3, 0, 3 };
    button->horizontalAlignment = UI::HorizontalAlignment::Left;
    return button;
}

GameManager::GameManager(std::string dataDir)
    : m_clicks(dataDir)
    , m_cubes(dataDir)
{
    m_grid             = std::make_shared<UI::Grid>(3, 2);
    m_grid->name       = UIEntityName;
    m_grid->background = GridBackground;

    int row = 0;
    for (const auto& clickable : m_clicks.GetClickables()) {
        auto block = MakeTextBlock(clickable.ToString(), 20);
        m_grid->Add(block, row++, 0);
        m_clickTexts.push_back(block);
    }

    auto load = MakeButton("Load Data");
    load->onClick = [this] { LoadData(); };
    m_grid->Add(load, 0, 1);

    auto save = MakeButton("Save Data");
    save->onClick = [this] { SaveData(); };
    m_grid->Add(save, 1, 1);

    // Shares the Save cell, pushed right by its margin.
    auto del = MakeButton("Delete Data");
    del->margin  = { 223, 3, 0, 3 };
    del->onClick = [this] { DeleteData(); };
    m_grid->Add(del, 1, 1);

    m_message                      = MakeTextBlock(IntroMessage, 16);
    m_message->horizontalAlignment = UI::HorizontalAlignment::Center;
    m_message->textAlignment       = UI::HorizontalAlignment::Center;
    m_grid->Add(m_message, 2, 0, 2);
}

void GameManager::Start(Game& game)
{
    BuildUI(game);
    SpawnCube(game, FirstCubePosition);
    m_cubes.UpdatePositions(CubePositions(game));
}

void GameManager::BuildUI(Game& game)
{
    auto entity = std::make_shared<Entity>(UIEntityName);
    entity->Add<UI::UIComponent>(std::make_shared<UI::Page>(m_grid), RenderGroup::Group31);
    game.GetRootScene().Add(std::move(entity));
}

std::shared_ptr<UI::Button> GameManager::GetButton(const std::string& name) const
{
    for (const auto& child : m_grid->Children())
        if (child->name == name)
            if (auto button = std::dynamic_pointer_cast<UI::Button>(child)) return button;
    return nullptr;
}

std::string GameManager::GetClickText(MouseButtonType type) const
{
    const auto& clickables = m_clicks.GetClickables();
    for (std::size_t i = 0; i < clickables.size() && i < m_clickTexts.size(); ++i)
        if (clickables[i].type == type) return m_clickTexts[i]->text;
    return {};
}

void GameManager::RefreshClickTexts()
{
    const auto& clickables = m_clicks.GetClickables();
    for (std::size_t i = 0; i < clickables.size() && i < m_clickTexts.size(); ++i)
        m_clickTexts[i]->text = clickables[i].ToString();
}

void GameManager::HandleClick(MouseButtonType type, std::vector<Vector3> positions)
{
    m_cubes.UpdatePositions(std::move(positions));

    Clickable* clickable = m_clicks.Find(type);
    if (!clickable) return;

    clickable->HandleClick();
    RefreshClickTexts();
}

// ─── Cubes ────────────────────────────────────────────────────────────────────

Entity* GameManager::SpawnCube(Game& game, Vector3 position)
{
    Color color = { (unsigned char)GetRandomValue(40, 255), (unsigned char)GetRandomValue(40, 255),
                    (unsigned char)GetRandomValue(40, 255), 255 };

    GameExtensions::Primitive3DCreationOptions options;
    options.entityName = CubeEntityName;
    options.material   = GameExtensions::CreateMaterial(game, color);

    auto cube = GameExtensions::CreatePrimitive(game, GFX::PrimitiveModelType::Cube, options);
    cube->transform.position = position;
    return game.GetRootScene().Add(std::move(cube));
}

std::vector<Vector3> GameManager::CubePositions(Game& game) const
{
    std::vector<Vector3> positions;
    for (const auto& e : game.GetRootScene().Entities())
        if (e->GetName() == CubeEntityName) positions.push_back(e->WorldPosition());
    return positions;
}

Entity* GameManager::ClickCube(Game& game, Entity* cube, MouseButtonType type)
{
    if (!cube || cube->GetName() != CubeEntityName) return nullptr;

    Entity* spawned = nullptr;
    if (type == MouseButtonType::Left) {
        Vector3 at = cube->WorldPosition();
        at.x += (float)GetRandomValue(-50, 50) / 100.0f;
        at.y += SpawnHeight;
        at.z += (float)GetRandomValue(-50, 50) / 100.0f;
        spawned = SpawnCube(game, at);
    } else {
        game.GetRootScene().Remove(cube);
    }

    HandleClick(type, CubePositions(game));
    return spawned;
}

void GameManager::RebuildCubes(Game& game)
{
    Scene& scene = game.GetRootScene();
    scene.RemoveAll(CubeEntityName);

    std::vector<Vector3> positions = m_cubes.GetPositions();
    if (positions.empty()) positions.push_back(FirstCubePosition);
    for (const auto& p : positions) SpawnCube(game, p);

    m_cubes.UpdatePositions(CubePositions(game));
    TraceLog(LOG_DEBUG, "[GameManager] Rebuilt %d cube(s)", (int)positions.size());
}

bool GameManager::IsOverUI(Vector2 mouse) const
{
    return CheckCollisionPointRec(mouse, m_grid->Bounds());
}

void GameManager::Update(Game& game)
{
    if (reloadCubes) {
        reloadCubes = false;
        RebuildCubes(game);
    }

    const Input::InputSource& in = game.GetInput();
    bool left  = in.IsMouseButtonPressed(MOUSE_BUTTON_LEFT);
    bool right = in.IsMouseButtonPressed(MOUSE_BUTTON_RIGHT);
    if (!left && !right) return;

    Vector2 mouse = in.MousePosition();
    if (IsOverUI(mouse)) return;

    CameraComponent* camera = nullptr;
    game.GetRootScene().ForEach<CameraComponent>([&](Entity&, CameraComponent& c) {
        if (!camera && c.enabled) camera = &c;
    });
    if (!camera) return;

    Ray  ray = camera->ScreenPointToRay(mouse, game.ScreenWidth(), game.ScreenHeight());
    auto hit = game.GetSimulation().Raycast(game.GetRootScene(), ray.position, ray.direction);
    if (!hit || !hit.entity) return;

    ClickCube(game, hit.entity, left ? MouseButtonType::Left : MouseButtonType::Right);
}

// ─── Persistence ──────────────────────────────────────────────────────────────

void GameManager::LoadData()
{
    bool clicksLoaded = false;
    try {
        clicksLoaded = m_clicks.TryLoad();
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "[GameManager] Error during load operation: %s", e.what());
        clicksLoaded = false;
    }

    try {
        m_cubes.LoadData();
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "[GameManager] Error during load operation: %s", e.what());
        m_cubes.UpdatePositions({});
    }

    RefreshClickTexts();
    m_message->text = clicksLoaded ? "Data loaded. Start clicking." : "No click data found.";
    reloadCubes     = true;
}

void GameManager::SaveData()
{
    try {
        m_clicks.Save();
        m_cubes.SaveData();
        m_message->text = "Data saved. Keep clicking.";
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "[GameManager] Error during save operation: %s", e.what());
    }
}

void GameManager::DeleteData()
{
    try {
        m_clicks.Delete();
        m_cubes.DeleteData();
        m_message->text = "Data deleted.";
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "[GameManager] Error during delete operation: %s", e.what());
    }
    RefreshClickTexts();
}

} // namespace CubeClicker
