#pragma once

#include <filesystem>

namespace vecshard::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();
    }

}
