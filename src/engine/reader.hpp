#pragma once

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <functional>
#include <filesystem>
#include "vecshard/types.hpp"
#include "key_index.hpp"
#include "scratch_array.hpp"

namespace vecshard::engine {

    struct ScratchOptions {
        ScratchMappedArray::Backing backing = ScratchMappedArray::Backing::TempFile;
        std::filesystem::path directory; // empty: system temp dir
    };

    /**
     * @brief Presents every shard of a store as one table indexed 0..N-1.
     *
     * open() copies the shards into a private scratch mapping in manifest order
     * and opens the key index read-only. Once open, all methods are const and
     * may be called from several threads.
     *
     * Lookup direction is chosen by the caller: get_by_key() resolves a string
     * key through the key index, get_by_id() indexes the table directly. The
     * get() overloads dispatch on the static argument type, so get("42") is a
     * key lookup and get(42) an id lookup.
     */
    class Reader {
    public:
        explicit Reader(std::filesystem::path root, ScratchOptions scratch = {});
        ~Reader();

        Reader(const Reader&) = delete;
        Reader& operator=(const Reader&) = delete;

        /**
         * @brief Checks that map.db, shards/ and metadata.tsv exist. Never throws.
         */
        bool validate() const;

        /**
         * @throws ValidationError if a store component is missing or inconsistent.
         */
        void open();
        void close();
        bool is_open() const { return m_open; }

        std::vector<float> get_by_key(const std::string& key) const;
        std::vector<float> get_by_id(EntryId id) const;

        std::vector<float> get(const std::string& key) const { return get_by_key(key); }
        std::vector<float> get(const char* key) const { return get_by_key(key); }
        std::vector<float> get(EntryId id) const { return get_by_id(id); }
        std::vector<float> get(int id) const { return get_by_id(id); }

        /**
         * @brief Pointer to a stored row inside the scratch mapping.
         */
        const float* row(EntryId id) const;

        EntryId id_of(const std::string& key) const;
        std::string key_of(EntryId id) const;

        /**
         * @brief Keys in id order.
         */
        std::vector<std::string> ids() const;
        void for_each_id(const std::function<void(EntryId, const std::string&)>& callback) const;

        /**
         * @brief Zero-copy view of the whole table, valid until close().
         */
        MatrixView embedding_matrix() const;

        std::size_t size() const;
        std::size_t dimension() const;
        std::pair<std::size_t, std::size_t> shape() const;
        const std::vector<ShardInfo>& shards() const;

        const std::filesystem::path& root() const { return m_root; }

    private:
        void require_open() const;
        void check_id(EntryId id) const;

        std::filesystem::path m_root;
        ScratchOptions m_scratch_options;
        bool m_open = false;

        std::vector<ShardInfo> m_shards;
        std::size_t m_rows = 0;
        std::size_t m_dimension = 0;

        std::unique_ptr<KeyIndex> m_keys;
        ScratchMappedArray m_table;
    };

}
