#pragma once

#include <string>

namespace Kindling {

// Directory holding the running executable. Empty if it cannot be determined.
const std::string& ExecutableDirectory();

// Absolute paths are returned as-is. Relative paths are joined to
// ExecutableDirectory(), so Resources/ and scripts/ shipped next to the
// binary are found whatever the working directory is.
std::string ResolveAssetPath(const std::string& assetPath);

} // namespace Kindling
