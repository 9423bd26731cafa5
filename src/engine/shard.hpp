#pragma once

#include <vector>
#include <string>
#include <filesystem>
#include "vecshard/types.hpp"

namespace vecshard::engine {

    /**
     * @brief Fixed-capacity, append-only block of vectors.
     *
     * Rows live in an in-memory buffer until save() writes the occupied
     * rows to disk as raw row-major float32.
     */
    class Shard {
    public:
        Shard(std::size_t capacity, std::size_t dimension);

        std::size_t capacity() const { return m_capacity; }
        std::size_t dimension() const { return m_dimension; }
        std::size_t size() const { return m_size; }
        bool empty() const { return m_size == 0; }
        bool full() const { return m_size == m_capacity; }

        /**
         * @brief Copies one vector of dimension() floats into the next free slot.
         * @throws StoreError if the shard is full.
         */
        void append(const float* values);

        const float* row(std::size_t i) const { return m_data.data() + i * m_dimension; }

        /**
         * @brief Persists the occupied rows and fsyncs the file.
         */
        void save(const std::filesystem::path& path) const;

        /**
         * @brief Empties the shard, keeping its buffer allocated.
         */
        void reset();

        /**
         * @brief Deterministic file name for a shard index, e.g. shards_000003.shrd.
         */
        static std::string filename(std::size_t shard_id);

    private:
        std::size_t m_capacity;
        std::size_t m_dimension;
        std::size_t m_size = 0;
        std::vector<float> m_data;
    };

}
