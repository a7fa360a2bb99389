#ifndef IMGSAN_CLI_PARSER_HPP
#define IMGSAN_CLI_PARSER_HPP

#include "../../../libimgsan/include/engine_config.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;
    bool no_heuristics = false;
    bool digest_names = false;
    bool skip_existing = false;

    int workers = 1;
    std::string mode;                 ///< "sanitize", "report" or empty (inferred from -o)
    std::int64_t timeout_ms = 0;      ///< 0 means no per-file timeout
    std::string hash_sample_size;     ///< e.g. "512K"
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;
    std::vector<std::string> heuristics;
    std::vector<std::string> keep_categories;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Translates parsed settings into an engine configuration.
 *
 * A directory input becomes the source root, file inputs become explicit
 * sources. Without --mode, giving -o selects sanitize mode.
 *
 * @throws imgsan::ConfigError for values CLI11 cannot check on its own.
 */
[[nodiscard]] imgsan::EngineConfig make_engine_config(const Settings& settings);

#endif // IMGSAN_CLI_PARSER_HPP
