#pragma once

#include <raylib.h>
#include <string>
#include <vector>

namespace CubeClicker {

// Cube positions, persisted to <dataDir>/cubes.json.
class CubeDataManager {
public:
    static constexpr const char* FileName = "cubes.json";

    explicit CubeDataManager(std::string dataDir = ".");

    void UpdatePositions(std::vector<Vector3> positions) { m_positions = std::move(positions); }
    const std::vector<Vector3>& GetPositions() const { return m_positions; }

    // Replaces the stored positions; empty when there is no file. Throws on
    // malformed data and leaves the stored positions untouched.
    std::vector<Vector3> LoadData();

    void SaveData() const;
    void DeleteData();

    std::string FilePath() const;

private:
    std::string          m_dataDir;
    std::vector<Vector3> m_positions;
};

} // namespace CubeClicker
