#include "shard.hpp"
#include "mapped_file.hpp"
#include "vecshard/errors.hpp"
#include <cstdio>

namespace vecshard::engine {

    Shard::Shard(std::size_t capacity, std::size_t dimension)
        : m_capacity(capacity), m_dimension(dimension) {}

    void Shard::append(const float* values) {
        if (full()) {
            throw StoreError("shard is full (" + std::to_string(m_capacity) + " rows)");
        }
        m_data.insert(m_data.end(), values, values + m_dimension);
        ++m_size;
    }

    void Shard::save(const std::filesystem::path& path) const {
        write_file_durably(path, m_data.data(), m_size * m_dimension * sizeof(float));
    }

    void Shard::reset() {
        m_data.clear();
        m_size = 0;
    }

    std::string Shard::filename(std::size_t shard_id) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "shards_%06zu.shrd", shard_id);
        return buf;
    }

}
