#pragma once

#include <cstddef>
#include <filesystem>

namespace vecshard::engine {

    /**
     * @brief Read-only memory mapping of a whole file. Released on destruction.
     */
    class MappedFile {
    public:
        MappedFile() = default;
        explicit MappedFile(const std::filesystem::path& path);
        ~MappedFile();

        MappedFile(const MappedFile&) = delete;
        MappedFile& operator=(const MappedFile&) = delete;
        MappedFile(MappedFile&& other) noexcept;
        MappedFile& operator=(MappedFile&& other) noexcept;

        const void* data() const { return m_data; }
        std::size_t size() const { return m_size; }

        void release();

    private:
        void* m_data = nullptr;
        std::size_t m_size = 0;
    };

    /**
     * @brief Writes bytes to path (truncating) and fsyncs before returning.
     * @throws IoError on any failure.
     */
    void write_file_durably(const std::filesystem::path& path, const void* data, std::size_t bytes);

    /**
     * @brief Writes every byte to an open descriptor, retrying on EINTR.
     */
    void write_all(int fd, const void* data, std::size_t bytes, const std::filesystem::path& path);

    /**
     * @brief fsyncs a directory so that newly created entries survive a crash.
     */
    void sync_directory(const std::filesystem::path& dir);

}
