#include "CubeDataManager.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace CubeClicker {

CubeDataManager::CubeDataManager(std::string dataDir)
    : m_dataDir(std::move(dataDir))
{
}

std::string CubeDataManager::FilePath() const
{
    return (fs::path(m_dataDir) / FileName).string();
}

std::vector<Vector3> CubeDataManager::LoadData()
{
    const std::string path = FilePath();
    if (!fs::exists(path)) {
        TraceLog(LOG_INFO, "[CubeData] No cube data at %s", path.c_str());
        m_positions.clear();
        return {};
    }

    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("cannot open " + path);

    nlohmann::json j;
    in >> j;
    if (!j.is_array()) throw std::runtime_error("cube data must be an array");

    std::vector<Vector3> positions;
    for (const auto& p : j)
        positions.push_back({ p.at("x").get<float>(), p.at("y").get<float>(), p.at("z").get<float>() });

    m_positions = positions;
    TraceLog(LOG_INFO, "[CubeData] Loaded %d cube(s) from %s", (int)positions.size(), path.c_str());
    return positions;
}

void CubeDataManager::SaveData() const
{
    nlohmann::json j = nlohmann::json::array();
    for (const auto& p : m_positions) j.push_back({ { "x", p.x }, { "y", p.y }, { "z", p.z } });

    const std::string path = FilePath();
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot write " + path);
    out << j.dump(2);
    TraceLog(LOG_INFO, "[CubeData] Saved %d cube(s) to %s", (int)m_positions.size(), path.c_str());
}

void CubeDataManager::DeleteData()
{
    std::error_code ec;
    fs::remove(FilePath(), ec);
    if (ec) throw std::runtime_error("cannot delete " + FilePath() + ": " + ec.message());
    m_positions.clear();
}

} // namespace CubeClicker
