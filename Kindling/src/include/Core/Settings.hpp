#pragma once

#include <string>

namespace Kindling {

// Window, timing and logging configuration for a Game.
// Filled with defaults, then optionally overridden from the command line.
struct GameSettings {
    int         width        = 1280;
    int         height       = 720;
    std::string title        = "Kindling";
    bool        resizable    = true;
    int         targetFPS    = 60;      // 0 = uncapped

    // Headless mode never opens a window: the loop ticks with a fixed step and
    // nothing is drawn. Used by tests and batch runs.
    bool        headless     = false;
    int         maxFrames    = 0;       // 0 = run until Exit() / window close
    float       fixedTimeStep = 1.0f / 60.0f;

    int         logLevel     = 4;       // raylib TraceLogLevel, LOG_WARNING
    std::string dataDir      = ".";
    std::string scriptPath;
};

// Parse --width, --height, --title, --fps, --headless, --frames, --log-level,
// --data-dir and --script. Unknown arguments are ignored (and logged).
GameSettings ParseCommandLine(int argc, char** argv, GameSettings defaults = {});

// "trace", "debug", "info", "warning", "error", "fatal", "none" -> raylib level.
// Returns -1 for an unknown name.
int ParseLogLevel(const std::string& name);

} // namespace Kindling
