#include "../../include/file_utils.hpp"
#include "../../include/error.hpp"
#include <chrono>
#include <cstdio>
#include <random>
#include <string>
#include <system_error>
#include <thread>

namespace {
    // per-thread generator, workers name temp files concurrently
    std::string random_suffix() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
        return buf;
    }
} // namespace

namespace imgsan {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // long path prefix bypasses MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    void ensure_directory(const std::filesystem::path& dir) {
        if (dir.empty()) return;
        std::error_code ec;
        for (int attempt = 0; attempt < 3; ++attempt) {
            std::filesystem::create_directories(dir, ec);
            if (!ec) return;
            // another worker may have created part of the chain in between
            std::error_code probe;
            if (std::filesystem::is_directory(dir, probe)) return;
        }
        throw WriteError("Cannot create directory " + dir.string() + ": " + ec.message());
    }

    std::filesystem::path make_temp_sibling(const std::filesystem::path& target) {
        return target.parent_path() /
               ("." + target.filename().string() + ".imgsan-" + random_suffix() + ".tmp");
    }

    void commit_temp_file(const std::filesystem::path& temp, const std::filesystem::path& target) {
        std::error_code ec;
        int retries = 10;
        while (retries > 0) {
            std::filesystem::rename(temp, target, ec);
            if (!ec) return;

            // sharing violation / access denied on Windows
            if (ec.value() != 32 && ec.value() != 5) break;

            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            --retries;
        }
        remove_quietly(temp);
        throw WriteError("Rename to " + target.string() + " failed: " + ec.message());
    }

    void remove_quietly(const std::filesystem::path& path) noexcept {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

} // namespace imgsan
