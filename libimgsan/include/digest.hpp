/**
 * @file digest.hpp
 * @brief Content digests used for digest output names and destination de-duplication.
 */

#ifndef IMGSAN_DIGEST_HPP
#define IMGSAN_DIGEST_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace imgsan {

    /// Number of hex digits kept in digest file names.
    inline constexpr std::size_t kShortDigestLength = 12;

    /**
     * @brief Hex SHA-1 of a file.
     * @param path File to hash.
     * @param sample_size Hash only the first `sample_size` bytes when set.
     * @throws DecodeError if the file cannot be read.
     */
    [[nodiscard]] std::string sha1_hex(const std::filesystem::path& path,
                                       std::optional<std::uintmax_t> sample_size = std::nullopt);

    /**
     * @brief First kShortDigestLength hex digits of sha1_hex().
     */
    [[nodiscard]] std::string short_digest(const std::filesystem::path& path,
                                           std::optional<std::uintmax_t> sample_size = std::nullopt);

    /**
     * @brief Extracts the short digest from an output file name.
     *
     * Searches the stem, case-insensitively, for twelve hex digits,
     * optionally after a leading "<n>_". The result is lower case.
     */
    [[nodiscard]] std::optional<std::string> digest_from_name(std::string_view filename);

    /**
     * @brief Short digests of every digest-named file under `root` (recursive).
     * A missing root yields an empty set.
     */
    [[nodiscard]] std::unordered_set<std::string> collect_existing_digests(const std::filesystem::path& root);

    /**
     * @brief Parses a human readable size ("4096", "512K", "2MB", "1GiB").
     *
     * Decimal suffixes (K, KB, M, MB, G, GB) are powers of 1000; binary
     * suffixes (KiB, MiB, GiB) powers of 1024. Case-insensitive.
     *
     * @throws ConfigError on malformed input or a zero size.
     */
    [[nodiscard]] std::uintmax_t parse_size(std::string_view text);

} // namespace imgsan

#endif // IMGSAN_DIGEST_HPP
