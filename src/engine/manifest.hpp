#pragma once

#include <vector>
#include <filesystem>
#include "vecshard/types.hpp"

namespace vecshard::engine {

    /**
     * @brief Tab-separated list of flushed shards, one row per shard in flush order.
     *
     * Header: shard, shard_id, n, d
     */
    class Manifest {
    public:
        static constexpr const char* kHeader = "shard\tshard_id\tn\td";

        /**
         * @brief Parses and validates a manifest file.
         * @throws ValidationError on a missing file, bad header, malformed row,
         *         inconsistent dimension or out-of-order shard ids.
         */
        static std::vector<ShardInfo> read(const std::filesystem::path& path);
    };

    /**
     * @brief Append-only writer for metadata.tsv. Every row is fsynced before append() returns.
     */
    class ManifestWriter {
    public:
        explicit ManifestWriter(std::filesystem::path path);
        ~ManifestWriter();

        ManifestWriter(const ManifestWriter&) = delete;
        ManifestWriter& operator=(const ManifestWriter&) = delete;

        /**
         * @brief Opens for appending. A fresh (or truncated) file gets the header row.
         */
        void open(bool truncate);
        void append(const ShardInfo& info);
        void close();

        bool is_open() const { return m_fd >= 0; }

    private:
        std::filesystem::path m_path;
        int m_fd = -1;
    };

}
