#pragma once

#include <vector>
#include <string>
#include <memory>
#include <filesystem>
#include "vecshard/types.hpp"

namespace vecshard::engine {

    enum class Metric {
        L2,          // squared euclidean
        InnerProduct // 1 - dot(a, b)
    };

    /**
     * @throws ValidationError for anything but "l2" or "ip".
     */
    Metric parse_metric(const std::string& name);
    std::string metric_name(Metric metric);

    /**
     * @brief Abstract base class for a prebuilt nearest-neighbor index over store ids.
     * Building and training the index happens elsewhere; implementations only load and query.
     */
    class SearchIndex {
    public:
        virtual ~SearchIndex() = default;

        /**
         * @brief Finds up to k nearest stored vectors.
         * @param query dimension() floats.
         * @return Hits ordered nearest first.
         */
        virtual std::vector<SearchHit> search(const float* query, std::size_t k) const = 0;

        virtual std::size_t dimension() const = 0;

        /**
         * @brief Number of indexed vectors.
         */
        virtual std::size_t count() const = 0;
    };

    /**
     * @brief Loads a hierarchical NSW graph saved by hnswlib.
     * @param ef Search breadth; 0 keeps the default. hnswlib never searches narrower than k.
     */
    std::unique_ptr<SearchIndex> load_hnsw_index(const std::filesystem::path& path, Metric metric,
                                                 std::size_t dimension, std::size_t ef = 0);

    /**
     * @brief Loads an exhaustive (brute-force) index saved by hnswlib.
     */
    std::unique_ptr<SearchIndex> load_flat_index(const std::filesystem::path& path, Metric metric,
                                                 std::size_t dimension);

    /**
     * @brief Picks the loader from the file stem: "hnsw" or "flat"/"bruteforce".
     * @throws ValidationError if the kind cannot be inferred.
     */
    std::unique_ptr<SearchIndex> load_search_index(const std::filesystem::path& path, Metric metric,
                                                   std::size_t dimension, std::size_t ef = 0);

    /**
     * @brief Finds the trained index file (trained*index) in a store root.
     * @throws ValidationError if there is none or more than one.
     */
    std::filesystem::path find_trained_index(const std::filesystem::path& root);

}
