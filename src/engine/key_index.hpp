#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <functional>
#include <mutex>
#include <sqlite3.h>
#include "vecshard/types.hpp"

namespace vecshard::engine {

    /**
     * @brief Durable two-way map between external string keys and internal ids.
     *
     * Backed by a SQLite file with two relations, forward (id -> key) and
     * backward (key -> id). Writes accumulate in one open transaction until
     * commit(); they are visible to reads on the same handle before that.
     */
    class KeyIndex {
    public:
        explicit KeyIndex(std::filesystem::path path, bool read_only = false);
        ~KeyIndex();

        KeyIndex(const KeyIndex&) = delete;
        KeyIndex& operator=(const KeyIndex&) = delete;

        /**
         * @brief Opens the backing database, creating the schema when writable.
         * Does nothing if already open.
         */
        void open();

        /**
         * @brief Commits pending writes and releases the connection.
         */
        void close();

        bool is_open() const { return m_db != nullptr; }
        bool read_only() const { return m_read_only; }

        /**
         * @brief Flips read-only mode. An open handle commits and reopens in the new mode.
         */
        void toggle_read_only();

        /**
         * @brief Registers a new (id, key) pair.
         * @throws DuplicateKeyError if the key exists, DuplicateIdError if the id exists.
         * A failed call leaves the index unchanged.
         */
        void add(EntryId id, const std::string& key, bool commit = false);

        /**
         * @brief Makes all pending writes durable.
         */
        void commit();

        std::string resolve_by_id(EntryId id) const;
        EntryId resolve_by_key(const std::string& key) const;

        bool contains_key(const std::string& key) const;
        bool contains_id(EntryId id) const;

        /**
         * @brief All keys in insertion order.
         */
        std::vector<std::string> keys() const;

        /**
         * @brief Streams (id, key) pairs in insertion order. Each call re-runs the query.
         */
        void for_each_key(const std::function<void(EntryId, const std::string&)>& callback) const;

        std::size_t size() const;

        /**
         * @brief Removes every entry whose id is >= first_id.
         * @return Number of entries removed.
         */
        std::size_t truncate(EntryId first_id);

        const std::filesystem::path& path() const { return m_path; }

    private:
        void initialize_schema();
        void begin_batch();
        void exec(const char* sql);
        void require_open() const;
        void require_writable() const;

        std::filesystem::path m_path;
        bool m_read_only;
        bool m_in_batch = false;
        sqlite3* m_db = nullptr;
        mutable std::mutex m_mutex;
    };

}
