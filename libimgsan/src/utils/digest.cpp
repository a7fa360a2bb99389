#include "../../include/digest.hpp"
#include "../../include/error.hpp"
#include "../../include/file_utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <memory>
#include <regex>
#include <system_error>
#include <vector>

namespace {

    struct MdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using unique_MD_CTX = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

    constexpr std::size_t kReadChunk = 64 * 1024;

} // namespace

namespace imgsan {

    std::string sha1_hex(const std::filesystem::path& path, const std::optional<std::uintmax_t> sample_size) {
        const unique_FILE fp(open_file(path, "rb"));
        if (!fp) {
            throw DecodeError("Cannot open for hashing: " + path.string());
        }

        const unique_MD_CTX ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
            throw Error("EVP_DigestInit_ex failed");
        }

        std::vector<unsigned char> buffer(kReadChunk);
        std::optional<std::uintmax_t> remaining = sample_size;
        while (!remaining || *remaining > 0) {
            std::size_t want = buffer.size();
            if (remaining) want = static_cast<std::size_t>(std::min<std::uintmax_t>(want, *remaining));
            const std::size_t got = std::fread(buffer.data(), 1, want, fp.get());
            if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), got) != 1) {
                throw Error("EVP_DigestUpdate failed");
            }
            if (remaining) *remaining -= got;
            if (got < want) break;
        }
        if (std::ferror(fp.get())) {
            throw DecodeError("Read error while hashing: " + path.string());
        }

        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
            throw Error("EVP_DigestFinal_ex failed");
        }

        static constexpr char kHex[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(md_len * 2);
        for (unsigned int i = 0; i < md_len; ++i) {
            hex += kHex[md[i] >> 4];
            hex += kHex[md[i] & 0x0f];
        }
        return hex;
    }

    std::string short_digest(const std::filesystem::path& path, const std::optional<std::uintmax_t> sample_size) {
        return sha1_hex(path, sample_size).substr(0, kShortDigestLength);
    }

    std::optional<std::string> digest_from_name(const std::string_view filename) {
        static const std::regex pattern(R"((?:^\d+_)?([a-f0-9]{12}))", std::regex::icase);
        const std::string stem = std::filesystem::path(filename).stem().string();
        std::smatch m;
        if (!std::regex_search(stem, m, pattern)) {
            return std::nullopt;
        }
        std::string digest = m[1].str();
        std::ranges::transform(digest, digest.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return digest;
    }

    std::unordered_set<std::string> collect_existing_digests(const std::filesystem::path& root) {
        std::unordered_set<std::string> digests;
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) return digests;

        const auto options = std::filesystem::directory_options::skip_permission_denied;
        std::error_code entry_ec;
        for (auto it = std::filesystem::recursive_directory_iterator(root, options, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(entry_ec)) continue;
            if (auto digest = digest_from_name(it->path().filename().string())) {
                digests.insert(std::move(*digest));
            }
        }
        return digests;
    }

    std::uintmax_t parse_size(const std::string_view text) {
        std::uintmax_t value = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr == first) {
            throw ConfigError("Invalid size: '" + std::string(text) + "'");
        }

        std::string suffix(ptr, last);
        std::ranges::transform(suffix, suffix.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::uintmax_t multiplier = 0;
        if (suffix.empty() || suffix == "b") multiplier = 1;
        else if (suffix == "k" || suffix == "kb") multiplier = 1000;
        else if (suffix == "m" || suffix == "mb") multiplier = 1000 * 1000;
        else if (suffix == "g" || suffix == "gb") multiplier = 1000 * 1000 * 1000;
        else if (suffix == "kib") multiplier = 1024;
        else if (suffix == "mib") multiplier = 1024 * 1024;
        else if (suffix == "gib") multiplier = 1024 * 1024 * 1024;
        else throw ConfigError("Invalid size suffix: '" + std::string(text) + "'");

        if (value == 0) {
            throw ConfigError("Size must be greater than zero: '" + std::string(text) + "'");
        }
        if (value > std::numeric_limits<std::uintmax_t>::max() / multiplier) {
            throw ConfigError("Size is too large: '" + std::string(text) + "'");
        }
        return value * multiplier;
    }

} // namespace imgsan
