#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include "vecshard/types.hpp"
#include "key_index.hpp"
#include "manifest.hpp"
#include "shard.hpp"

namespace vecshard::engine {

    /**
     * @brief Appends keyed vectors to a sharded store.
     *
     * Vectors collect in an in-memory shard of fixed capacity. When it fills,
     * the next set() persists it, appends its manifest row and commits the key
     * index, in that order, before starting a new shard. A crash therefore loses
     * at most the unflushed shard; nothing on disk ever names a partial shard.
     *
     * Only one writer may be open on a store root at a time. This is not checked.
     */
    class Writer {
    public:
        static constexpr std::size_t kDefaultDimension = 512;
        static constexpr std::size_t kDefaultShardSize = std::size_t(1) << 17;

        /**
         * @throws ValidationError if dimension or shard_size is zero.
         */
        explicit Writer(std::filesystem::path root,
                        std::size_t dimension = kDefaultDimension,
                        std::size_t shard_size = kDefaultShardSize);
        ~Writer();

        Writer(const Writer&) = delete;
        Writer& operator=(const Writer&) = delete;

        /**
         * @brief Creates the store layout (or resumes an existing one) and opens the key index.
         * Does nothing if already open.
         */
        void open();

        /**
         * @brief Appends a vector under a new key.
         * @param commit Commit the key index right after registering the key.
         * @return true if the call flushed a full shard first.
         * @throws DimensionMismatchError, DuplicateKeyError, ClosedError, IoError.
         */
        bool set(const std::string& key, const std::vector<float>& vector, bool commit = false);
        bool set(const std::string& key, const float* values, std::size_t count, bool commit = false);

        /**
         * @brief Flushes a non-empty current shard and commits the key index. Idempotent.
         */
        void close();

        bool is_open() const { return m_open; }
        std::size_t size() const { return static_cast<std::size_t>(m_next_id); }
        std::size_t shard_count() const { return m_shard_id; }
        std::size_t dimension() const { return m_dimension; }
        std::size_t shard_size() const { return m_shard_size; }
        const std::filesystem::path& root() const { return m_root; }

    private:
        void resume(const std::vector<ShardInfo>& rows);
        void flush_shard();

        std::filesystem::path m_root;
        std::size_t m_dimension;
        std::size_t m_shard_size;

        std::size_t m_shard_id = 0;
        EntryId m_next_id = 0;
        bool m_open = false;
        bool m_row_written = false; // current shard is on disk and in the manifest

        KeyIndex m_keys;
        ManifestWriter m_manifest;
        std::unique_ptr<Shard> m_shard;
    };

}
