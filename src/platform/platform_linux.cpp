#include "../platform.hpp"
#include <cstdlib>

namespace vecshard::platform {

    namespace system {
        std::filesystem::path get_config_dir() {
            if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
                return std::filesystem::path(xdg) / "vecshard";
            }
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/vecshard" : "";
        }
    }

}
