#ifndef IMGSAN_FILE_UTILS_HPP
#define IMGSAN_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>

namespace imgsan {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Creates a directory and its parents if they do not exist.
     *
     * Safe to call concurrently for the same or overlapping paths: losing
     * a creation race to another thread is not an error.
     *
     * @throws WriteError if the directory cannot be created.
     */
    void ensure_directory(const std::filesystem::path &dir);

    /**
     * @brief Returns a unique temporary path next to `target`.
     *
     * The sanitized copy is written there first and renamed into place
     * by commit_temp_file(), so an interrupted write never leaves a
     * half-written file under the target name.
     */
    std::filesystem::path make_temp_sibling(const std::filesystem::path &target);

    /**
     * @brief Atomically moves a finished temp file to its final name.
     *
     * Retries briefly on sharing violations. The temp file is removed on
     * failure.
     *
     * @throws WriteError if the rename fails.
     */
    void commit_temp_file(const std::filesystem::path &temp, const std::filesystem::path &target);

    /**
     * @brief Removes a file, ignoring errors (best-effort cleanup).
     */
    void remove_quietly(const std::filesystem::path &path) noexcept;

} // namespace imgsan

#endif // IMGSAN_FILE_UTILS_HPP
