#pragma once

#include <istream>
#include <string>
#include <vector>
#include <cstddef>
#include "writer.hpp"

namespace vecshard::engine {

    struct ImportStats {
        std::size_t imported = 0;
        std::size_t skipped = 0;
    };

    /**
     * @brief Splits "key<TAB>v1<TAB>v2..." into a key and its values.
     * @return false for a line without a key.
     * @throws ValidationError if a value is not a float.
     */
    bool parse_vector_line(const std::string& line, std::string& key, std::vector<float>& values);

    /**
     * @brief Appends every vector line of input to an open writer. Blank and keyless lines are skipped.
     * A malformed value raises ValidationError naming its line; errors from Writer::set propagate unchanged.
     */
    ImportStats import_tsv(std::istream& input, Writer& writer);

}
