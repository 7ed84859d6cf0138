#include "ClickDataManager.hpp"
#include <raylib.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace CubeClicker {

const char* ToString(MouseButtonType type)
{
    return type == MouseButtonType::Left ? "Left" : "Right";
}

std::string Clickable::ToString() const
{
    return std::string(CubeClicker::ToString(type)) + " Clicks: " + std::to_string(count);
}

ClickDataManager::ClickDataManager(std::string dataDir)
    : m_dataDir(std::move(dataDir))
{
    m_clickables.push_back({ MouseButtonType::Left, 0 });
    m_clickables.push_back({ MouseButtonType::Right, 0 });
}

Clickable* ClickDataManager::Find(MouseButtonType type)
{
    for (auto& c : m_clickables)
        if (c.type == type) return &c;
    return nullptr;
}

std::string ClickDataManager::FilePath() const
{
    return (fs::path(m_dataDir) / FileName).string();
}

nlohmann::json ClickDataManager::ToJson() const
{
    nlohmann::json j = nlohmann::json::array();
    for (const auto& c : m_clickables)
        j.push_back({ { "type", CubeClicker::ToString(c.type) }, { "count", c.count } });
    return j;
}

void ClickDataManager::FromJson(const nlohmann::json& j)
{
    if (!j.is_array()) throw std::runtime_error("click data must be an array");

    // Counters are only replaced once the whole array has parsed.
    std::vector<Clickable> parsed = m_clickables;
    for (auto& c : parsed) c.count = 0;
    for (const auto& item : j) {
        std::string type = item.at("type").get<std::string>();
        int         count = item.at("count").get<int>();
        for (auto& c : parsed)
            if (type == CubeClicker::ToString(c.type)) c.count = count;
    }
    m_clickables = std::move(parsed);
}

bool ClickDataManager::TryLoad()
{
    const std::string path = FilePath();
    if (!fs::exists(path)) {
        TraceLog(LOG_INFO, "[ClickData] No click data at %s", path.c_str());
        return false;
    }

    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("cannot open " + path);

    nlohmann::json j;
    in >> j;
    FromJson(j);
    TraceLog(LOG_INFO, "[ClickData] Loaded %s", path.c_str());
    return true;
}

void ClickDataManager::Save() const
{
    const std::string path = FilePath();
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot write " + path);
    out << ToJson().dump(2);
    TraceLog(LOG_INFO, "[ClickData] Saved %s", path.c_str());
}

void ClickDataManager::Delete()
{
    std::error_code ec;
    fs::remove(FilePath(), ec);
    if (ec) throw std::runtime_error("cannot delete " + FilePath() + ": " + ec.message());
    for (auto& c : m_clickables) c.count = 0;
}

} // namespace CubeClicker
