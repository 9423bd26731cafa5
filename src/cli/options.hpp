#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace vecshard::cli {

    /**
     * @brief Finds "flag value" in args, stores value and removes both.
     * @return false if the flag is absent or has no value after it.
     */
    bool take_option(std::vector<std::string>& args, const std::string& flag, std::string& value);

    /**
     * @brief Parses a non-negative decimal count.
     * @throws ValidationError on anything else, including a sign.
     */
    std::size_t parse_size(const std::string& text, const std::string& what);

}
