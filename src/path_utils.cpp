#include "path_utils.h"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace viva {

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string resolve_relative(const std::string& base_dir, const std::string& path) {
    if (path.empty() || base_dir.empty()) return path;
    fs::path p(path);
    if (p.is_absolute()) return path;
    return (fs::path(base_dir) / p).lexically_normal().string();
}

std::string default_espeak_data_path() {
#if defined(__linux__)
    const char* candidates[] = {
        "/usr/share/espeak-ng-data",
        "/usr/lib/x86_64-linux-gnu/espeak-ng-data",
        "/usr/lib/aarch64-linux-gnu/espeak-ng-data",
    };
    std::error_code ec;
    for (const char* candidate : candidates) {
        if (fs::exists(fs::path(candidate) / "phontab", ec)) return candidate;
    }
    return candidates[0];
#elif defined(__APPLE__)
    return "/opt/homebrew/share/espeak-ng-data";
#else
    return "";
#endif
}

} // namespace viva
