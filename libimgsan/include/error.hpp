/**
 * @file error.hpp
 * @brief Exception types thrown by libimgsan.
 */

#ifndef IMGSAN_ERROR_HPP
#define IMGSAN_ERROR_HPP

#include <stdexcept>
#include <string>

namespace imgsan {

    /**
     * @brief Base class for every error raised by the library.
     */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief Invalid engine configuration.
     *
     * This is the only error that aborts a whole run. It is raised before
     * any file is dispatched.
     */
    class ConfigError final : public Error {
    public:
        explicit ConfigError(const std::string& what) : Error(what) {}
    };

    /**
     * @brief A file could not be decoded (unreadable, truncated, corrupt).
     */
    class DecodeError final : public Error {
    public:
        explicit DecodeError(const std::string& what) : Error(what) {}
    };

    /**
     * @brief The sanitized copy could not be written.
     */
    class WriteError final : public Error {
    public:
        explicit WriteError(const std::string& what) : Error(what) {}
    };

    /**
     * @brief A content heuristic faulted. Never fails the file.
     */
    class HeuristicError final : public Error {
    public:
        explicit HeuristicError(const std::string& what) : Error(what) {}
    };

} // namespace imgsan

#endif // IMGSAN_ERROR_HPP
