#pragma once

#include <cstddef>
#include <filesystem>

namespace vecshard::engine {

    /**
     * @brief Process-local float matrix backed by a memory mapping.
     *
     * File backing creates a temporary file in the scratch directory and unlinks
     * it immediately, so the pages are reclaimed by the kernel once the mapping
     * is gone, even if the process dies. Anonymous backing skips the file.
     * The mapping is released on destruction or release(); move-only.
     */
    class ScratchMappedArray {
    public:
        enum class Backing {
            TempFile,
            Anonymous
        };

        ScratchMappedArray() = default;

        /**
         * @param scratch_dir Directory for the temporary file; empty means the system temp dir.
         * @throws IoError if the backing file or mapping cannot be created.
         */
        ScratchMappedArray(std::size_t rows, std::size_t cols,
                           Backing backing = Backing::TempFile,
                           const std::filesystem::path& scratch_dir = {});
        ~ScratchMappedArray();

        ScratchMappedArray(const ScratchMappedArray&) = delete;
        ScratchMappedArray& operator=(const ScratchMappedArray&) = delete;
        ScratchMappedArray(ScratchMappedArray&& other) noexcept;
        ScratchMappedArray& operator=(ScratchMappedArray&& other) noexcept;

        float* data() { return m_data; }
        const float* data() const { return m_data; }
        float* row(std::size_t i) { return m_data + i * m_cols; }
        const float* row(std::size_t i) const { return m_data + i * m_cols; }

        std::size_t rows() const { return m_rows; }
        std::size_t cols() const { return m_cols; }
        std::size_t bytes() const { return m_rows * m_cols * sizeof(float); }
        bool mapped() const { return m_data != nullptr; }

        void release();

    private:
        float* m_data = nullptr;
        std::size_t m_rows = 0;
        std::size_t m_cols = 0;
        int m_fd = -1;
    };

}
