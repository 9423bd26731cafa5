#include "manifest.hpp"
#include "mapped_file.hpp"
#include "vecshard/errors.hpp"
#include <charconv>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <fcntl.h>
#include <unistd.h>

namespace vecshard::engine {

    namespace {

        std::vector<std::string> split_tabs(const std::string& line) {
            std::vector<std::string> fields;
            size_t start = 0;
            while (true) {
                size_t tab = line.find('\t', start);
                fields.push_back(line.substr(start, tab - start));
                if (tab == std::string::npos) break;
                start = tab + 1;
            }
            return fields;
        }

        std::size_t parse_count(const std::string& field, const std::filesystem::path& path, size_t line_no) {
            std::size_t value = 0;
            const char* end = field.data() + field.size();
            auto [ptr, ec] = std::from_chars(field.data(), end, value);
            if (ec != std::errc() || ptr != end || field.empty()) {
                throw ValidationError(path.string() + ":" + std::to_string(line_no) + ": bad number '" + field + "'");
            }
            return value;
        }

    }

    std::vector<ShardInfo> Manifest::read(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw ValidationError("cannot open manifest: " + path.string());
        }

        std::vector<ShardInfo> rows;
        std::string line;
        size_t line_no = 0;
        bool header_seen = false;

        while (std::getline(in, line)) {
            ++line_no;
            // Rows written by csv-style tools end in \r\n.
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            if (!header_seen) {
                if (line != kHeader) {
                    throw ValidationError(path.string() + ": unexpected manifest header '" + line + "'");
                }
                header_seen = true;
                continue;
            }

            auto fields = split_tabs(line);
            if (fields.size() != 4) {
                throw ValidationError(path.string() + ":" + std::to_string(line_no) + ": expected 4 fields, got " +
                                      std::to_string(fields.size()));
            }

            ShardInfo info;
            info.filename = std::filesystem::path(fields[0]).filename().string();
            info.shard_id = parse_count(fields[1], path, line_no);
            info.n = parse_count(fields[2], path, line_no);
            info.d = parse_count(fields[3], path, line_no);

            if (info.filename.empty()) {
                throw ValidationError(path.string() + ":" + std::to_string(line_no) + ": empty shard name");
            }
            if (info.shard_id != rows.size()) {
                throw ValidationError(path.string() + ":" + std::to_string(line_no) + ": shard id " +
                                      std::to_string(info.shard_id) + " out of sequence");
            }
            if (info.d == 0 || (!rows.empty() && info.d != rows.front().d)) {
                throw ValidationError(path.string() + ":" + std::to_string(line_no) + ": inconsistent dimension " +
                                      std::to_string(info.d));
            }
            rows.push_back(std::move(info));
        }

        if (!header_seen) {
            throw ValidationError(path.string() + ": missing manifest header");
        }
        return rows;
    }

    ManifestWriter::ManifestWriter(std::filesystem::path path) : m_path(std::move(path)) {}

    ManifestWriter::~ManifestWriter() { close(); }

    void ManifestWriter::open(bool truncate) {
        if (m_fd >= 0) return;

        int flags = O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC;
        if (truncate) flags |= O_TRUNC;
        m_fd = ::open(m_path.c_str(), flags, 0644);
        if (m_fd < 0) {
            throw IoError("open failed " + m_path.string() + ": " + std::strerror(errno));
        }

        if (truncate) {
            std::string header = std::string(Manifest::kHeader) + "\n";
            try {
                write_all(m_fd, header.data(), header.size(), m_path);
            } catch (const IoError&) {
                close();
                throw;
            }
            if (::fsync(m_fd) != 0) {
                std::string msg = std::strerror(errno);
                close();
                throw IoError("fsync failed " + m_path.string() + ": " + msg);
            }
        }
    }

    void ManifestWriter::append(const ShardInfo& info) {
        if (m_fd < 0) throw ClosedError("manifest is closed: " + m_path.string());

        std::string row = info.filename + "\t" + std::to_string(info.shard_id) + "\t" +
                          std::to_string(info.n) + "\t" + std::to_string(info.d) + "\n";
        write_all(m_fd, row.data(), row.size(), m_path);
        if (::fsync(m_fd) != 0) {
            throw IoError("fsync failed " + m_path.string() + ": " + std::strerror(errno));
        }
    }

    void ManifestWriter::close() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

}
