#include <Core/Settings.hpp>
#include <raylib.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace Kindling {

int ParseLogLevel(const std::string& name)
{
    std::string lower = name;
    for (auto& c : lower) c = (char)tolower((unsigned char)c);

    struct { const char* name; int level; } levels[] = {
        {"all",     LOG_ALL},
        {"trace",   LOG_TRACE},
        {"debug",   LOG_DEBUG},
        {"info",    LOG_INFO},
        {"warning", LOG_WARNING},
        {"error",   LOG_ERROR},
        {"fatal",   LOG_FATAL},
        {"none",    LOG_NONE},
    };
    for (const auto& l : levels)
        if (lower == l.name) return l.level;
    return -1;
}

static bool ParseInt(const char* text, int& out)
{
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0') return false;
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
    out = (int)v;
    return true;
}

GameSettings ParseCommandLine(int argc, char** argv, GameSettings settings)
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        int value = 0;

        if (arg == "--headless") {
            settings.headless = true;
        } else if (arg == "--width" && hasValue && ParseInt(argv[i + 1], value)) {
            settings.width = std::max(value, 1); ++i;
        } else if (arg == "--height" && hasValue && ParseInt(argv[i + 1], value)) {
            settings.height = std::max(value, 1); ++i;
        } else if (arg == "--fps" && hasValue && ParseInt(argv[i + 1], value)) {
            settings.targetFPS = std::max(value, 0); ++i;
        } else if (arg == "--frames" && hasValue && ParseInt(argv[i + 1], value)) {
            settings.maxFrames = std::max(value, 0); ++i;
        } else if (arg == "--title" && hasValue) {
            settings.title = argv[++i];
        } else if (arg == "--data-dir" && hasValue) {
            settings.dataDir = argv[++i];
        } else if (arg == "--script" && hasValue) {
            settings.scriptPath = argv[++i];
        } else if (arg == "--log-level" && hasValue) {
            int level = ParseLogLevel(argv[++i]);
            if (level >= 0) settings.logLevel = level;
            else TraceLog(LOG_WARNING, "[Settings] Unknown log level '%s'", argv[i]);
        } else {
            TraceLog(LOG_WARNING, "[Settings] Ignoring argument '%s'", arg.c_str());
        }
    }
    TraceLog(LOG_DEBUG, "[Settings] %dx%d fps=%d headless=%d frames=%d dataDir=%s script=%s",
             settings.width, settings.height, settings.targetFPS, settings.headless ? 1 : 0,
             settings.maxFrames, settings.dataDir.c_str(), settings.scriptPath.c_str());
    return settings;
}

} // namespace Kindling
