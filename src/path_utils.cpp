#include "path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace carebridge {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string resolve_config_relative(const std::string& config_path, const std::string& path) {
    if (path.empty()) return path;
    std::string expanded = expand_path(path);
    fs::path p(expanded);
    if (p.is_absolute() || config_path.empty()) {
        return expanded;
    }
    fs::path base = fs::path(config_path).parent_path();
    if (base.empty()) {
        return expanded;
    }
    return (base / p).lexically_normal().string();
}

} // namespace carebridge
