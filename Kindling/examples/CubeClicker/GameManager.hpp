#pragma once

#include "ClickDataManager.hpp"
#include "CubeDataManager.hpp"
#include <Engine/Components.hpp>
#include <Engine/Game.hpp>
#include <UI/UI.hpp>
#include <memory>
#include <string>
#include <vector>

namespace CubeClicker {

inline constexpr const char* CubeEntityName = "Cube";
inline constexpr const char* UIEntityName   = "GameUI";

// Owns the HUD, the click counters and the cube positions.
//
// Left-clicking a cube spawns another one above it, right-clicking removes
// it. The Load / Save / Delete buttons round-trip both counters and cube
// positions through JSON files in the data directory.
class GameManager : public Kindling::ScriptComponent {
public:
    static constexpr const char* IntroMessage =
        "Left-clicking on a cube creates a new one, while right-clicking will remove it.";

    explicit GameManager(std::string dataDir = ".");

    void Start(Kindling::Game& game) override;
    void Update(Kindling::Game& game) override;

    // Count the click and remember where the cubes are now.
    void HandleClick(MouseButtonType type, std::vector<Vector3> positions);

    // Apply a click on `cube`. Returns the spawned cube for a left click.
    Kindling::Entity* ClickCube(Kindling::Game& game, Kindling::Entity* cube, MouseButtonType type);

    Kindling::Entity* SpawnCube(Kindling::Game& game, Vector3 position);

    void LoadData();
    void SaveData();
    void DeleteData();

    const std::string& GetMessage() const { return m_message->text; }
    std::string        GetClickText(MouseButtonType type) const;

    ClickDataManager& Clicks() { return m_clicks; }
    CubeDataManager&  Cubes()  { return m_cubes; }

    std::shared_ptr<Kindling::UI::Grid> GetGrid() const { return m_grid; }
    std::shared_ptr<Kindling::UI::Button> GetButton(const std::string& name) const;

    // Set after a load; the next Update rebuilds the cubes from saved positions.
    bool reloadCubes = false;

private:
    void BuildUI(Kindling::Game& game);
    void RefreshClickTexts();
    void RebuildCubes(Kindling::Game& game);
    std::vector<Vector3> CubePositions(Kindling::Game& game) const;
    bool IsOverUI(Vector2 mouse) const;

    ClickDataManager m_clicks;
    CubeDataManager  m_cubes;

    std::shared_ptr<Kindling::UI::Grid>                    m_grid;
    std::vector<std::shared_ptr<Kindling::UI::TextBlock>>  m_clickTexts;
    std::shared_ptr<Kindling::UI::TextBlock>               m_message;
};

} // namespace CubeClicker
