#include "writer.hpp"
#include "mapped_file.hpp"
#include "vecshard/errors.hpp"
#include <iostream>

namespace vecshard::engine {

    namespace {

        void ensure_directory(const std::filesystem::path& dir) {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw IoError("cannot create " + dir.string() + ": " + ec.message());
            }
        }

    }

    Writer::Writer(std::filesystem::path root, std::size_t dimension, std::size_t shard_size)
        : m_root(std::move(root)),
          m_dimension(dimension),
          m_shard_size(shard_size),
          m_keys(StoreLayout::keys(m_root)),
          m_manifest(StoreLayout::metadata(m_root)) {
        if (m_dimension == 0) throw ValidationError("embedding dimension must be positive");
        if (m_shard_size == 0) throw ValidationError("shard size must be positive");
    }

    Writer::~Writer() {
        try {
            close();
        } catch (const std::exception& e) {
            std::cerr << "[Writer] Error while closing " << m_root << ": " << e.what() << "\n";
        }
    }

    void Writer::open() {
        if (m_open) return;

        ensure_directory(m_root);
        ensure_directory(StoreLayout::shards(m_root));

        auto metadata = StoreLayout::metadata(m_root);
        std::error_code ec;
        bool resuming = std::filesystem::exists(metadata, ec) && std::filesystem::file_size(metadata, ec) > 0;

        std::vector<ShardInfo> rows;
        if (resuming) {
            rows = Manifest::read(metadata);
        }

        m_keys.open();
        resume(rows);
        m_manifest.open(!resuming);
        m_shard = std::make_unique<Shard>(m_shard_size, m_dimension);
        m_row_written = false;
        m_open = true;

        std::clog << "[Writer] Opened " << m_root << " (d=" << m_dimension << ", shard size=" << m_shard_size
                  << ", " << m_next_id << " existing vectors in " << m_shard_id << " shards)\n";
    }

    void Writer::resume(const std::vector<ShardInfo>& rows) {
        m_shard_id = 0;
        m_next_id = 0;
        for (const auto& row : rows) {
            if (row.d != m_dimension) {
                m_keys.close();
                throw ValidationError("store " + m_root.string() + " has dimension " + std::to_string(row.d) +
                                      ", writer configured for " + std::to_string(m_dimension));
            }
            m_next_id += static_cast<EntryId>(row.n);
            ++m_shard_id;
        }

        // Keys committed ahead of their shard never became readable; drop them.
        std::size_t dropped = m_keys.truncate(m_next_id);
        if (dropped > 0) {
            std::cerr << "[Writer] Dropped " << dropped << " keys without a flushed shard\n";
        }
    }

    bool Writer::set(const std::string& key, const std::vector<float>& vector, bool commit) {
        return set(key, vector.data(), vector.size(), commit);
    }

    bool Writer::set(const std::string& key, const float* values, std::size_t count, bool commit) {
        if (!m_open) throw ClosedError("writer is closed: " + m_root.string());
        if (count != m_dimension) {
            throw DimensionMismatchError("expected vector of dimension " + std::to_string(m_dimension) +
                                         ", got " + std::to_string(count));
        }
        if (m_keys.contains_key(key)) {
            throw DuplicateKeyError("duplicate key: " + key);
        }

        bool rolled_over = false;
        // A shard whose row is already written is finished, even if a failed close left it partial.
        if (m_shard->full() || m_row_written) {
            flush_shard();
            rolled_over = true;
        }

        m_keys.add(m_next_id, key, commit);
        m_shard->append(values);
        ++m_next_id;
        return rolled_over;
    }

    void Writer::flush_shard() {
        auto name = Shard::filename(m_shard_id);
        auto shard_dir = StoreLayout::shards(m_root);

        ShardInfo info;
        info.filename = name;
        info.shard_id = m_shard_id;
        info.n = m_shard->size();
        info.d = m_dimension;

        // A retry after a failed key commit must not append the same row twice.
        if (!m_row_written) {
            m_shard->save(shard_dir / name);
            sync_directory(shard_dir);
            m_manifest.append(info);
            m_row_written = true;
        }
        m_keys.commit();

        std::clog << "[Writer] Flushed " << name << " (" << info.n << " x " << info.d << ")\n";
        ++m_shard_id;
        m_shard->reset();
        m_row_written = false;
    }

    void Writer::close() {
        if (!m_open) return;

        if (!m_shard->empty()) {
            flush_shard();
        }
        m_keys.close();
        m_manifest.close();
        m_shard.reset();
        m_open = false;

        std::clog << "[Writer] Closed " << m_root << " (" << m_next_id << " vectors, " << m_shard_id << " shards)\n";
    }

}
