#pragma once

#include <string>

namespace orbiter {
namespace config {

// $HOME/.config/orbiter/<file> (%APPDATA%\Orbiter\<file> on Windows),
// or just <file> when no home directory is set
std::string defaultConfigFile(const std::string& file);

// Create the directories leading up to a file path
void ensureParentDirectory(const std::string& path);

} // namespace config
} // namespace orbiter
