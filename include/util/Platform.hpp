#pragma once

#include <filesystem>

namespace halo::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
};

}  // namespace halo::util
