#include "search_index.hpp"
#include "vecshard/errors.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <iostream>

namespace vecshard::engine {

    Metric parse_metric(const std::string& name) {
        if (name == "l2") return Metric::L2;
        if (name == "ip") return Metric::InnerProduct;
        throw ValidationError("unknown metric '" + name + "' (expected l2 or ip)");
    }

    std::string metric_name(Metric metric) {
        return metric == Metric::L2 ? "l2" : "ip";
    }

    namespace {

        std::unique_ptr<hnswlib::SpaceInterface<float>> make_space(Metric metric, std::size_t dim) {
            if (metric == Metric::InnerProduct) {
                return std::make_unique<hnswlib::InnerProductSpace>(dim);
            }
            return std::make_unique<hnswlib::L2Space>(dim);
        }

        class HnswlibIndex : public SearchIndex {
        public:
            HnswlibIndex(std::unique_ptr<hnswlib::SpaceInterface<float>> space, std::size_t dim)
                : m_space(std::move(space)), m_dim(dim) {}

            void load_graph(const std::filesystem::path& path, std::size_t ef) {
                auto graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(m_space.get(), path.string());
                check_element_size(graph->label_offset_ - graph->offsetData_, path);
                if (ef > 0) graph->setEf(ef);
                m_graph = graph.get();
                m_alg = std::move(graph);
            }

            void load_flat(const std::filesystem::path& path) {
                auto flat = std::make_unique<hnswlib::BruteforceSearch<float>>(m_space.get(), path.string());
                check_element_size(flat->size_per_element_ - sizeof(hnswlib::labeltype), path);
                m_alg = std::move(flat);
            }

            std::vector<SearchHit> search(const float* query, std::size_t k) const override {
                std::vector<SearchHit> hits;
                k = std::min(k, count());
                if (k == 0) return hits;

                // searchKnn returns a max-heap of <distance, label>
                auto pq = m_alg->searchKnn(query, k);
                hits.reserve(pq.size());
                while (!pq.empty()) {
                    hits.push_back({static_cast<EntryId>(pq.top().second), pq.top().first});
                    pq.pop();
                }
                // Popped furthest to nearest, so reverse it
                std::reverse(hits.begin(), hits.end());
                return hits;
            }

            std::size_t dimension() const override { return m_dim; }

            std::size_t count() const override {
                if (m_graph) return m_graph->getCurrentElementCount();
                auto* flat = static_cast<hnswlib::BruteforceSearch<float>*>(m_alg.get());
                return flat->cur_element_count;
            }

        private:
            // hnswlib trusts the caller's space, so a file built for another d would read out of bounds.
            void check_element_size(std::size_t stored_bytes, const std::filesystem::path& path) const {
                if (stored_bytes != m_space->get_data_size()) {
                    throw DimensionMismatchError(path.filename().string() + " stores vectors of dimension " +
                                                 std::to_string(stored_bytes / sizeof(float)) + ", expected " +
                                                 std::to_string(m_dim));
                }
            }

            std::unique_ptr<hnswlib::SpaceInterface<float>> m_space;
            std::unique_ptr<hnswlib::AlgorithmInterface<float>> m_alg;
            hnswlib::HierarchicalNSW<float>* m_graph = nullptr;
            std::size_t m_dim;
        };

        void require_file(const std::filesystem::path& path) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                throw ValidationError("index file not found: " + path.string());
            }
        }

    }

    std::unique_ptr<SearchIndex> load_hnsw_index(const std::filesystem::path& path, Metric metric,
                                                 std::size_t dimension, std::size_t ef) {
        require_file(path);
        auto index = std::make_unique<HnswlibIndex>(make_space(metric, dimension), dimension);
        try {
            index->load_graph(path, ef);
        } catch (const StoreError&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw IoError("[SearchIndex] Cannot load HNSW index " + path.string() + ": " + e.what());
        }
        std::clog << "[SearchIndex] Loaded HNSW index " << path.filename() << " (" << index->count()
                  << " items, " << metric_name(metric) << ")\n";
        return index;
    }

    std::unique_ptr<SearchIndex> load_flat_index(const std::filesystem::path& path, Metric metric,
                                                 std::size_t dimension) {
        require_file(path);
        auto index = std::make_unique<HnswlibIndex>(make_space(metric, dimension), dimension);
        try {
            index->load_flat(path);
        } catch (const StoreError&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw IoError("[SearchIndex] Cannot load flat index " + path.string() + ": " + e.what());
        }
        std::clog << "[SearchIndex] Loaded flat index " << path.filename() << " (" << index->count()
                  << " items, " << metric_name(metric) << ")\n";
        return index;
    }

    std::unique_ptr<SearchIndex> load_search_index(const std::filesystem::path& path, Metric metric,
                                                   std::size_t dimension, std::size_t ef) {
        std::string stem = path.stem().string();
        if (stem.find("hnsw") != std::string::npos) {
            return load_hnsw_index(path, metric, dimension, ef);
        }
        if (stem.find("flat") != std::string::npos || stem.find("bruteforce") != std::string::npos) {
            return load_flat_index(path, metric, dimension);
        }
        throw ValidationError("cannot infer index type from " + path.filename().string());
    }

    std::filesystem::path find_trained_index(const std::filesystem::path& root) {
        std::vector<std::filesystem::path> candidates;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
            std::string name = entry.path().filename().string();
            bool matches = name.rfind("trained", 0) == 0 && name.size() >= 5 &&
                           name.compare(name.size() - 5, 5, "index") == 0;
            if (matches && entry.is_regular_file()) {
                candidates.push_back(entry.path());
            }
        }
        if (ec) {
            throw ValidationError("cannot list " + root.string() + ": " + ec.message());
        }
        if (candidates.empty()) {
            throw ValidationError("no trained*index file in " + root.string());
        }
        if (candidates.size() > 1) {
            std::sort(candidates.begin(), candidates.end());
            std::string names;
            for (const auto& c : candidates) names += " " + c.filename().string();
            throw ValidationError("more than one trained index in " + root.string() + ":" + names);
        }
        return candidates.front();
    }

}
