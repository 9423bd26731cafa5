#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <filesystem>

namespace vecshard {

    using EntryId = std::int64_t;
    using Vector = std::vector<float>;

    /**
     * @brief One row of the shard manifest (metadata.tsv).
     */
    struct ShardInfo {
        std::string filename;
        std::size_t shard_id = 0;
        std::size_t n = 0;       // vectors persisted in the shard file
        std::size_t d = 0;
    };

    struct SearchHit {
        EntryId id = 0;
        float distance = 0.0f;
    };

    struct Neighbor {
        std::string key;
        float distance = 0.0f;
    };

    /**
     * @brief Read-only view over a row-major float matrix. Does not own its data.
     */
    struct MatrixView {
        const float* data = nullptr;
        std::size_t rows = 0;
        std::size_t cols = 0;

        const float* row(std::size_t i) const { return data + i * cols; }
        bool empty() const { return rows == 0; }
    };

    /**
     * @brief Fixed file names under a store root.
     */
    struct StoreLayout {
        static std::filesystem::path keys(const std::filesystem::path& root) { return root / "map.db"; }
        static std::filesystem::path shards(const std::filesystem::path& root) { return root / "shards"; }
        static std::filesystem::path metadata(const std::filesystem::path& root) { return root / "metadata.tsv"; }
    };

}
