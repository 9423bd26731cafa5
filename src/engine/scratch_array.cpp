#include "scratch_array.hpp"
#include "vecshard/errors.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

namespace vecshard::engine {

    ScratchMappedArray::ScratchMappedArray(std::size_t rows, std::size_t cols,
                                           Backing backing,
                                           const std::filesystem::path& scratch_dir)
        : m_rows(rows), m_cols(cols) {
        std::size_t size = bytes();
        if (size == 0) return;

        if (backing == Backing::Anonymous) {
            void* p = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (p == MAP_FAILED) {
                m_rows = m_cols = 0;
                throw IoError(std::string("anonymous mmap failed: ") + std::strerror(errno));
            }
            m_data = static_cast<float*>(p);
            return;
        }

        auto dir = scratch_dir.empty() ? std::filesystem::temp_directory_path() : scratch_dir;
        std::string pattern = (dir / "vecshard-scratch-XXXXXX").string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');

        m_fd = ::mkstemp(name.data());
        if (m_fd < 0) {
            m_rows = m_cols = 0;
            throw IoError("mkstemp failed in " + dir.string() + ": " + std::strerror(errno));
        }
        // Unlinked right away: the file lives only as long as the descriptor and mapping.
        ::unlink(name.data());

        if (::ftruncate(m_fd, static_cast<off_t>(size)) != 0) {
            std::string msg = std::strerror(errno);
            release();
            throw IoError("ftruncate of scratch file failed: " + msg);
        }

        void* p = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, 0);
        if (p == MAP_FAILED) {
            std::string msg = std::strerror(errno);
            release();
            throw IoError("mmap of scratch file failed: " + msg);
        }
        m_data = static_cast<float*>(p);
    }

    ScratchMappedArray::~ScratchMappedArray() { release(); }

    ScratchMappedArray::ScratchMappedArray(ScratchMappedArray&& other) noexcept
        : m_data(other.m_data), m_rows(other.m_rows), m_cols(other.m_cols), m_fd(other.m_fd) {
        other.m_data = nullptr;
        other.m_rows = other.m_cols = 0;
        other.m_fd = -1;
    }

    ScratchMappedArray& ScratchMappedArray::operator=(ScratchMappedArray&& other) noexcept {
        if (this != &other) {
            release();
            m_data = other.m_data;
            m_rows = other.m_rows;
            m_cols = other.m_cols;
            m_fd = other.m_fd;
            other.m_data = nullptr;
            other.m_rows = other.m_cols = 0;
            other.m_fd = -1;
        }
        return *this;
    }

    void ScratchMappedArray::release() {
        if (m_data) {
            ::munmap(m_data, bytes());
            m_data = nullptr;
        }
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
        m_rows = m_cols = 0;
    }

}
