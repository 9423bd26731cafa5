#include "reader.hpp"
#include "manifest.hpp"
#include "mapped_file.hpp"
#include "vecshard/errors.hpp"
#include <cstring>
#include <iostream>

namespace vecshard::engine {

    Reader::Reader(std::filesystem::path root, ScratchOptions scratch)
        : m_root(std::move(root)), m_scratch_options(std::move(scratch)) {}

    Reader::~Reader() { close(); }

    bool Reader::validate() const {
        std::error_code ec;
        return std::filesystem::is_directory(StoreLayout::shards(m_root), ec) &&
               std::filesystem::is_regular_file(StoreLayout::keys(m_root), ec) &&
               std::filesystem::is_regular_file(StoreLayout::metadata(m_root), ec);
    }

    void Reader::open() {
        if (m_open) return;

        if (!validate()) {
            throw ValidationError("not a vector store (need map.db, shards/, metadata.tsv): " + m_root.string());
        }

        auto rows = Manifest::read(StoreLayout::metadata(m_root));
        std::size_t total = 0;
        for (const auto& row : rows) total += row.n;
        std::size_t dim = rows.empty() ? 0 : rows.front().d;

        ScratchMappedArray table(total, dim, m_scratch_options.backing, m_scratch_options.directory);

        auto shard_dir = StoreLayout::shards(m_root);
        std::size_t offset = 0;
        for (const auto& row : rows) {
            auto path = shard_dir / row.filename;
            std::error_code ec;
            auto file_bytes = std::filesystem::file_size(path, ec);
            if (ec) {
                throw ValidationError("missing shard " + path.string() + ": " + ec.message());
            }
            std::size_t expected = row.n * row.d * sizeof(float);
            if (file_bytes != expected) {
                throw ValidationError("shard " + path.string() + " has " + std::to_string(file_bytes) +
                                      " bytes, manifest says " + std::to_string(expected));
            }

            if (row.n > 0) {
                MappedFile shard(path);
                std::memcpy(table.row(offset), shard.data(), expected);
            }
            offset += row.n;
        }

        auto keys = std::make_unique<KeyIndex>(StoreLayout::keys(m_root), true);
        keys->open();

        m_shards = std::move(rows);
        m_rows = total;
        m_dimension = dim;
        m_table = std::move(table);
        m_keys = std::move(keys);
        m_open = true;

        std::clog << "[Reader] Opened " << m_root << " (" << m_rows << " x " << m_dimension << ", "
                  << m_shards.size() << " shards)\n";
    }

    void Reader::close() {
        if (!m_open) return;

        m_keys.reset();
        m_table.release();
        m_shards.clear();
        m_rows = 0;
        m_dimension = 0;
        m_open = false;
    }

    void Reader::require_open() const {
        if (!m_open) throw ClosedError("reader is closed: " + m_root.string());
    }

    void Reader::check_id(EntryId id) const {
        if (id < 0 || static_cast<std::size_t>(id) >= m_rows) {
            throw NotFoundError("id " + std::to_string(id) + " not in table of " + std::to_string(m_rows));
        }
    }

    std::vector<float> Reader::get_by_key(const std::string& key) const {
        require_open();
        EntryId id = m_keys->resolve_by_key(key);
        if (id < 0 || static_cast<std::size_t>(id) >= m_rows) {
            throw NotFoundError("key " + key + " has no stored vector");
        }
        const float* p = m_table.row(static_cast<std::size_t>(id));
        return std::vector<float>(p, p + m_dimension);
    }

    std::vector<float> Reader::get_by_id(EntryId id) const {
        require_open();
        check_id(id);
        const float* p = m_table.row(static_cast<std::size_t>(id));
        return std::vector<float>(p, p + m_dimension);
    }

    const float* Reader::row(EntryId id) const {
        require_open();
        check_id(id);
        return m_table.row(static_cast<std::size_t>(id));
    }

    EntryId Reader::id_of(const std::string& key) const {
        require_open();
        return m_keys->resolve_by_key(key);
    }

    std::string Reader::key_of(EntryId id) const {
        require_open();
        check_id(id);
        return m_keys->resolve_by_id(id);
    }

    std::vector<std::string> Reader::ids() const {
        require_open();
        return m_keys->keys();
    }

    void Reader::for_each_id(const std::function<void(EntryId, const std::string&)>& callback) const {
        require_open();
        m_keys->for_each_key(callback);
    }

    MatrixView Reader::embedding_matrix() const {
        require_open();
        MatrixView view;
        view.data = m_table.data();
        view.rows = m_rows;
        view.cols = m_dimension;
        return view;
    }

    std::size_t Reader::size() const {
        require_open();
        return m_rows;
    }

    std::size_t Reader::dimension() const {
        require_open();
        return m_dimension;
    }

    std::pair<std::size_t, std::size_t> Reader::shape() const {
        require_open();
        return {m_rows, m_dimension};
    }

    const std::vector<ShardInfo>& Reader::shards() const {
        require_open();
        return m_shards;
    }

}
