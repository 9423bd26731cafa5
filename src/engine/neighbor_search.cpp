#include "neighbor_search.hpp"
#include "vecshard/errors.hpp"

namespace vecshard::engine {

    NeighborSearch::NeighborSearch(std::unique_ptr<Reader> reader, std::unique_ptr<SearchIndex> index)
        : m_reader(std::move(reader)), m_index(std::move(index)) {
        if (!m_reader || !m_reader->is_open()) {
            throw ClosedError("neighbor search needs an open reader");
        }
        if (!m_index) {
            throw ValidationError("neighbor search needs an index");
        }
        if (m_index->dimension() != m_reader->dimension()) {
            throw DimensionMismatchError("index dimension " + std::to_string(m_index->dimension()) +
                                         " does not match store dimension " +
                                         std::to_string(m_reader->dimension()));
        }
    }

    std::vector<Neighbor> NeighborSearch::nearest_neighbors(const std::vector<float>& query, std::size_t k) const {
        if (query.size() != m_reader->dimension()) {
            throw DimensionMismatchError("query has dimension " + std::to_string(query.size()) +
                                         ", store has " + std::to_string(m_reader->dimension()));
        }

        std::vector<Neighbor> results;
        auto hits = m_index->search(query.data(), k);
        results.reserve(hits.size());
        for (const auto& hit : hits) {
            // key_of throws NotFoundError for ids outside the store
            results.push_back({m_reader->key_of(hit.id), hit.distance});
        }
        return results;
    }

    std::vector<float> NeighborSearch::embedding(const std::string& key) const {
        return m_reader->get_by_key(key);
    }

    std::vector<std::string> NeighborSearch::keys() const {
        return m_reader->ids();
    }

    std::unique_ptr<NeighborSearch> load_neighbor_search(const std::filesystem::path& root,
                                                         Metric metric,
                                                         std::size_t ef,
                                                         ScratchOptions scratch) {
        auto reader = std::make_unique<Reader>(root, std::move(scratch));
        reader->open();

        auto index_path = find_trained_index(root);
        auto index = load_search_index(index_path, metric, reader->dimension(), ef);
        return std::make_unique<NeighborSearch>(std::move(reader), std::move(index));
    }

}
