#pragma once

#include <string>
#include <string_view>

namespace modsync::util {

// Final component of a path, accepting both '/' and '\' separators since
// archive paths may come from a Windows game install mounted under Wine.
inline std::string FileName(std::string_view path) {
  if (path.empty()) {
    return "unknown file";
  }
  const auto pos = path.find_last_of("/\\");
  if (pos == std::string_view::npos) {
    return std::string(path);
  }
  return std::string(path.substr(pos + 1));
}

} // namespace modsync::util
