#include "mapped_file.hpp"
#include "vecshard/errors.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vecshard::engine {

    namespace {

        IoError io_error(const std::string& what, const std::filesystem::path& path) {
            return IoError(what + " " + path.string() + ": " + std::strerror(errno));
        }

    }

    MappedFile::MappedFile(const std::filesystem::path& path) {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) throw io_error("open failed", path);

        struct stat st;
        if (::fstat(fd, &st) != 0) {
            auto err = io_error("fstat failed", path);
            ::close(fd);
            throw err;
        }
        m_size = static_cast<std::size_t>(st.st_size);

        // mmap of length 0 is invalid; an empty file maps to nothing.
        if (m_size > 0) {
            void* data = ::mmap(nullptr, m_size, PROT_READ, MAP_PRIVATE, fd, 0);
            if (data == MAP_FAILED) {
                auto err = io_error("mmap failed", path);
                ::close(fd);
                m_size = 0;
                throw err;
            }
            ::madvise(data, m_size, MADV_SEQUENTIAL);
            m_data = data;
        }
        ::close(fd);
    }

    MappedFile::~MappedFile() { release(); }

    MappedFile::MappedFile(MappedFile&& other) noexcept
        : m_data(other.m_data), m_size(other.m_size) {
        other.m_data = nullptr;
        other.m_size = 0;
    }

    MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
        if (this != &other) {
            release();
            m_data = other.m_data;
            m_size = other.m_size;
            other.m_data = nullptr;
            other.m_size = 0;
        }
        return *this;
    }

    void MappedFile::release() {
        if (m_data) {
            ::munmap(m_data, m_size);
            m_data = nullptr;
        }
        m_size = 0;
    }

    void write_all(int fd, const void* data, std::size_t bytes, const std::filesystem::path& path) {
        const auto* p = static_cast<const unsigned char*>(data);
        std::size_t done = 0;
        while (done < bytes) {
            ssize_t w = ::write(fd, p + done, bytes - done);
            if (w < 0) {
                if (errno == EINTR) continue;
                throw io_error("write failed", path);
            }
            done += static_cast<std::size_t>(w);
        }
    }

    void write_file_durably(const std::filesystem::path& path, const void* data, std::size_t bytes) {
        int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) throw io_error("open failed", path);

        try {
            write_all(fd, data, bytes, path);
        } catch (const IoError&) {
            ::close(fd);
            throw;
        }
        if (::fsync(fd) != 0) {
            auto err = io_error("fsync failed", path);
            ::close(fd);
            throw err;
        }
        if (::close(fd) != 0) throw io_error("close failed", path);
    }

    void sync_directory(const std::filesystem::path& dir) {
        int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fd < 0) throw io_error("open failed", dir);
        int rc = ::fsync(fd);
        ::close(fd);
        if (rc != 0) throw io_error("fsync failed", dir);
    }

}
