#include "paths.hpp"
#include <cstdlib>
#include <sys/stat.h>

#ifdef _WIN32
#include <direct.h>
#define MKDIR(path) _mkdir(path)
#else
#define MKDIR(path) mkdir(path, 0755)
#endif

namespace orbiter {
namespace config {

std::string defaultConfigFile(const std::string& file) {
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\Orbiter\\" + file;
    }
    return file;
#else
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/orbiter/" + file;
    }
    return file;
#endif
}

void ensureParentDirectory(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return;

    std::string dir = path.substr(0, pos);
    for (size_t i = 1; i < dir.size(); i++) {
        if (dir[i] == '/' || dir[i] == '\\') {
            MKDIR(dir.substr(0, i).c_str());
        }
    }
    // Already-existing directories fail with EEXIST
    MKDIR(dir.c_str());
}

} // namespace config
} // namespace orbiter
