#include <Core/AssetPath.hpp>
#include <raylib.h>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace Kindling {

static fs::path QueryExecutablePath()
{
#ifdef _WIN32
    wchar_t buf[MAX_PATH];
    DWORD len = GetModuleFileNameW(NULL, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH) return {};
    return fs::path(std::wstring(buf, len));
#else
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return exe;
#endif
}

const std::string& ExecutableDirectory()
{
    static const std::string dir = [] {
        fs::path exe = QueryExecutablePath();
        if (exe.empty()) {
            TraceLog(LOG_WARNING, "[Assets] Could not locate the executable; using relative paths");
            return std::string();
        }
        return exe.parent_path().string();
    }();
    return dir;
}

std::string ResolveAssetPath(const std::string& assetPath)
{
    if (assetPath.empty() || fs::path(assetPath).is_absolute()) return assetPath;

    const std::string& base = ExecutableDirectory();
    if (base.empty()) return assetPath;
    return (fs::path(base) / assetPath).lexically_normal().string();
}

} // namespace Kindling
