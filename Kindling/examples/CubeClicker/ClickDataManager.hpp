#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace CubeClicker {

enum class MouseButtonType { Left, Right };

const char* ToString(MouseButtonType type);

struct Clickable {
    MouseButtonType type;
    int             count = 0;

    void HandleClick() { ++count; }

    // "Left Clicks: 3"
    std::string ToString() const;
};

// Click counters per mouse button, persisted to <dataDir>/clicks.json.
class ClickDataManager {
public:
    static constexpr const char* FileName = "clicks.json";

    explicit ClickDataManager(std::string dataDir = ".");

    std::vector<Clickable>&       GetClickables()       { return m_clickables; }
    const std::vector<Clickable>& GetClickables() const { return m_clickables; }

    Clickable* Find(MouseButtonType type);

    // false when there is no file. Throws on unreadable or malformed data.
    bool TryLoad();

    // Throws std::runtime_error when the file cannot be written.
    void Save() const;

    // Remove the file and reset every counter.
    void Delete();

    std::string FilePath() const;

    nlohmann::json ToJson() const;
    void           FromJson(const nlohmann::json& j);

private:
    std::string            m_dataDir;
    std::vector<Clickable> m_clickables;
};

} // namespace CubeClicker
