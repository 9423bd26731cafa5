#include "options.hpp"
#include "vecshard/errors.hpp"
#include <charconv>

namespace vecshard::cli {

    bool take_option(std::vector<std::string>& args, const std::string& flag, std::string& value) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == flag) {
                value = args[i + 1];
                args.erase(args.begin() + i, args.begin() + i + 2);
                return true;
            }
        }
        return false;
    }

    std::size_t parse_size(const std::string& text, const std::string& what) {
        // from_chars rejects a leading '-' or '+' for unsigned targets
        std::size_t value = 0;
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (text.empty() || ec != std::errc() || ptr != end) {
            throw ValidationError("bad " + what + ": '" + text + "'");
        }
        return value;
    }

}
