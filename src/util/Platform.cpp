#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>

namespace halo::util {

std::filesystem::path Platform::get_config_directory() {
    halo::util::Logger::debug("Platform: Detecting config directory");
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "halo";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "halo";
    }
    halo::util::Logger::warn("Platform: HOME env var not set, using fallback: .config/halo");
    return ".config/halo";
}

}  // namespace halo::util
