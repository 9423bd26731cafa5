#pragma once

#include <vector>
#include <string>
#include <memory>
#include <filesystem>
#include "vecshard/types.hpp"
#include "reader.hpp"
#include "search_index.hpp"

namespace vecshard::engine {

    /**
     * @brief Queries a prebuilt index over a store and reports results by key.
     *
     * Owns both the reader and the index. Every id the index returns must exist
     * in the store; one that does not means the index was built over a different
     * table and is reported as NotFoundError.
     */
    class NeighborSearch {
    public:
        /**
         * @param reader An open reader.
         * @throws ClosedError if the reader is not open, DimensionMismatchError if
         *         the index and store dimensions differ.
         */
        NeighborSearch(std::unique_ptr<Reader> reader, std::unique_ptr<SearchIndex> index);

        /**
         * @brief Up to k (key, distance) pairs, nearest first, in the index's own order.
         */
        std::vector<Neighbor> nearest_neighbors(const std::vector<float>& query, std::size_t k = 8) const;

        /**
         * @brief Stored vector for a key, without searching.
         */
        std::vector<float> embedding(const std::string& key) const;

        std::vector<std::string> keys() const;

        const Reader& reader() const { return *m_reader; }
        const SearchIndex& index() const { return *m_index; }

    private:
        std::unique_ptr<Reader> m_reader;
        std::unique_ptr<SearchIndex> m_index;
    };

    /**
     * @brief Opens the store at root together with its trained*index file.
     */
    std::unique_ptr<NeighborSearch> load_neighbor_search(const std::filesystem::path& root,
                                                         Metric metric = Metric::L2,
                                                         std::size_t ef = 0,
                                                         ScratchOptions scratch = {});

}
