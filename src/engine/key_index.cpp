#include "key_index.hpp"
#include "vecshard/errors.hpp"
#include <iostream>

namespace vecshard::engine {

    namespace {

        // Finalizes on scope exit so that a throwing lookup never leaks the statement.
        struct Statement {
            sqlite3_stmt* handle = nullptr;

            Statement(sqlite3* db, const char* sql) {
                if (sqlite3_prepare_v2(db, sql, -1, &handle, nullptr) != SQLITE_OK) {
                    throw IoError(std::string("[KeyIndex] Prepare failed: ") + sqlite3_errmsg(db));
                }
            }
            ~Statement() { sqlite3_finalize(handle); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;
        };

        bool is_constraint(int rc) {
            return (rc & 0xff) == SQLITE_CONSTRAINT;
        }

        std::string column_string(sqlite3_stmt* stmt, int col) {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int bytes = sqlite3_column_bytes(stmt, col);
            return text ? std::string(text, static_cast<size_t>(bytes)) : std::string();
        }

    }

    KeyIndex::KeyIndex(std::filesystem::path path, bool read_only)
        : m_path(std::move(path)), m_read_only(read_only) {}

    KeyIndex::~KeyIndex() {
        try {
            close();
        } catch (const std::exception& e) {
            std::cerr << "[KeyIndex] Error while closing " << m_path << ": " << e.what() << "\n";
        }
    }

    void KeyIndex::open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db) return;

        // Read-only handles still open the file read-write (falling back to read-only
        // on write-protected files) so that a hot journal left by a crashed writer can
        // be rolled back. query_only keeps the connection from modifying anything else.
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
        if (!m_read_only) flags |= SQLITE_OPEN_CREATE;
        if (sqlite3_open_v2(m_path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw IoError("[KeyIndex] Failed to open " + m_path.string() + ": " + msg);
        }
        try {
            if (m_read_only) {
                exec("PRAGMA query_only = ON;");
            } else {
                initialize_schema();
            }
        } catch (const IoError&) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw;
        }
    }

    void KeyIndex::close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db) return;

        if (m_in_batch) {
            exec("COMMIT;");
            m_in_batch = false;
        }
        sqlite3_close(m_db);
        m_db = nullptr;
    }

    void KeyIndex::toggle_read_only() {
        bool was_open = is_open();
        close();
        m_read_only = !m_read_only;
        if (was_open) open();
    }

    void KeyIndex::initialize_schema() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS forward ("
            "  id INTEGER PRIMARY KEY,"
            "  prot_id TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS backward ("
            "  prot_id TEXT PRIMARY KEY,"
            "  id INTEGER NOT NULL"
            ");";
        exec(sql);
    }

    void KeyIndex::exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : sqlite3_errmsg(m_db);
            sqlite3_free(err_msg);
            throw IoError("[KeyIndex] " + msg);
        }
    }

    void KeyIndex::begin_batch() {
        if (!m_in_batch) {
            exec("BEGIN;");
            m_in_batch = true;
        }
    }

    void KeyIndex::require_open() const {
        if (!m_db) throw ClosedError("key index is closed: " + m_path.string());
    }

    void KeyIndex::require_writable() const {
        if (m_read_only) throw ReadOnlyError("key index is read-only: " + m_path.string());
    }

    void KeyIndex::add(EntryId id, const std::string& key, bool commit) {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();
        require_writable();
        begin_batch();

        exec("SAVEPOINT add_entry;");
        auto rollback = [this]() {
            exec("ROLLBACK TO add_entry;");
            exec("RELEASE add_entry;");
        };

        int rc;
        {
            Statement stmt(m_db, "INSERT INTO backward (prot_id, id) VALUES (?, ?);");
            sqlite3_bind_text(stmt.handle, 1, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
            sqlite3_bind_int64(stmt.handle, 2, id);
            rc = sqlite3_step(stmt.handle);
        }
        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(m_db);
            rollback();
            if (is_constraint(rc)) throw DuplicateKeyError("duplicate key: " + key);
            throw IoError("[KeyIndex] Insert failed: " + msg);
        }

        {
            Statement stmt(m_db, "INSERT INTO forward (id, prot_id) VALUES (?, ?);");
            sqlite3_bind_int64(stmt.handle, 1, id);
            sqlite3_bind_text(stmt.handle, 2, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
            rc = sqlite3_step(stmt.handle);
        }
        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(m_db);
            rollback();
            if (is_constraint(rc)) throw DuplicateIdError("duplicate id: " + std::to_string(id));
            throw IoError("[KeyIndex] Insert failed: " + msg);
        }
        exec("RELEASE add_entry;");

        if (commit) {
            exec("COMMIT;");
            m_in_batch = false;
        }
    }

    void KeyIndex::commit() {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();
        if (m_in_batch) {
            exec("COMMIT;");
            m_in_batch = false;
        }
    }

    std::string KeyIndex::resolve_by_id(EntryId id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();

        Statement stmt(m_db, "SELECT prot_id FROM forward WHERE id = ?;");
        sqlite3_bind_int64(stmt.handle, 1, id);
        if (sqlite3_step(stmt.handle) != SQLITE_ROW) {
            throw NotFoundError("id not found: " + std::to_string(id));
        }
        return column_string(stmt.handle, 0);
    }

    EntryId KeyIndex::resolve_by_key(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();

        Statement stmt(m_db, "SELECT id FROM backward WHERE prot_id = ?;");
        sqlite3_bind_text(stmt.handle, 1, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
        if (sqlite3_step(stmt.handle) != SQLITE_ROW) {
            throw NotFoundError("key not found: " + key);
        }
        return sqlite3_column_int64(stmt.handle, 0);
    }

    bool KeyIndex::contains_key(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();

        Statement stmt(m_db, "SELECT 1 FROM backward WHERE prot_id = ?;");
        sqlite3_bind_text(stmt.handle, 1, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
        return sqlite3_step(stmt.handle) == SQLITE_ROW;
    }

    bool KeyIndex::contains_id(EntryId id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();

        Statement stmt(m_db, "SELECT 1 FROM forward WHERE id = ?;");
        sqlite3_bind_int64(stmt.handle, 1, id);
        return sqlite3_step(stmt.handle) == SQLITE_ROW;
    }

    std::vector<std::string> KeyIndex::keys() const {
        std::vector<std::string> result;
        for_each_key([&](EntryId, const std::string& key) { result.push_back(key); });
        return result;
    }

    void KeyIndex::for_each_key(const std::function<void(EntryId, const std::string&)>& callback) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();

        Statement stmt(m_db, "SELECT id, prot_id FROM forward ORDER BY id;");
        int rc;
        while ((rc = sqlite3_step(stmt.handle)) == SQLITE_ROW) {
            callback(sqlite3_column_int64(stmt.handle, 0), column_string(stmt.handle, 1));
        }
        if (rc != SQLITE_DONE) {
            throw IoError(std::string("[KeyIndex] Scan failed: ") + sqlite3_errmsg(m_db));
        }
    }

    std::size_t KeyIndex::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();

        Statement stmt(m_db, "SELECT COUNT(*) FROM forward;");
        if (sqlite3_step(stmt.handle) != SQLITE_ROW) {
            throw IoError(std::string("[KeyIndex] Count failed: ") + sqlite3_errmsg(m_db));
        }
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.handle, 0));
    }

    std::size_t KeyIndex::truncate(EntryId first_id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        require_open();
        require_writable();
        begin_batch();

        std::size_t removed = 0;
        {
            Statement stmt(m_db, "DELETE FROM forward WHERE id >= ?;");
            sqlite3_bind_int64(stmt.handle, 1, first_id);
            if (sqlite3_step(stmt.handle) != SQLITE_DONE) {
                throw IoError(std::string("[KeyIndex] Truncate failed: ") + sqlite3_errmsg(m_db));
            }
            removed = static_cast<std::size_t>(sqlite3_changes(m_db));
        }
        {
            Statement stmt(m_db, "DELETE FROM backward WHERE id >= ?;");
            sqlite3_bind_int64(stmt.handle, 1, first_id);
            if (sqlite3_step(stmt.handle) != SQLITE_DONE) {
                throw IoError(std::string("[KeyIndex] Truncate failed: ") + sqlite3_errmsg(m_db));
            }
        }
        exec("COMMIT;");
        m_in_batch = false;
        return removed;
    }

}
