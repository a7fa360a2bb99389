#ifndef IMGSAN_MIME_DETECTOR_HPP
#define IMGSAN_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace imgsan {

    /**
     * @brief Provides cross-platform file type detection.
     *
     * This class abstracts the underlying mechanism for detecting MIME types.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         *
         * @param path The filesystem path to the file.
         * @return A string representing the MIME type (e.g., "image/jpeg"),
         * or an empty string if detection failed.
         *
         * @note On Linux/macOS, this uses libmagic with a private handle per
         * call, so it is safe to call from several threads.
         * @note On Windows, this falls back to a map of file extensions.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace imgsan
#endif // IMGSAN_MIME_DETECTOR_HPP
