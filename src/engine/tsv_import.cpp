#include "tsv_import.hpp"
#include "vecshard/errors.hpp"
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace vecshard::engine {

    bool parse_vector_line(const std::string& line, std::string& key, std::vector<float>& values) {
        values.clear();
        std::istringstream fields(line);
        if (!std::getline(fields, key, '\t') || key.empty()) return false;

        std::string field;
        while (std::getline(fields, field, '\t')) {
            char* end = nullptr;
            float v = std::strtof(field.c_str(), &end);
            if (field.empty() || end == field.c_str() || *end != '\0') {
                throw ValidationError("bad value '" + field + "' for key " + key);
            }
            values.push_back(v);
        }
        return true;
    }

    ImportStats import_tsv(std::istream& input, Writer& writer) {
        ImportStats stats;
        std::string line, key;
        std::vector<float> values;
        size_t line_no = 0;

        while (std::getline(input, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            try {
                if (!parse_vector_line(line, key, values)) {
                    std::cerr << "[Import] Skipping line " << line_no << ": no key\n";
                    ++stats.skipped;
                    continue;
                }
            } catch (const ValidationError& e) {
                throw ValidationError("line " + std::to_string(line_no) + ": " + e.what());
            }
            writer.set(key, values);
            ++stats.imported;
        }
        return stats;
    }

}
