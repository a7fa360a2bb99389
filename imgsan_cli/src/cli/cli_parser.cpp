#include "cli_parser.hpp"
#include "../../../libimgsan/include/digest.hpp"
#include "../../../libimgsan/include/error.hpp"
#include "../../../libimgsan/include/finding.hpp"
#include "../../../libimgsan/include/heuristic_registry.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <thread>

#ifndef IMGSAN_VERSION
#define IMGSAN_VERSION "0.1.0"
#endif

namespace {
// helper for validating finding category names
struct CategoryValidator : CLI::Validator {
    CategoryValidator() {
        name_ = "CATEGORY";
        func_ = [](const std::string& str) {
            if (!imgsan::parse_category(str)) {
                return std::string("Invalid category: '") + str +
                       "'. Must be one of: EXIF-GPS, EXIF-Device, EXIF-Timestamp, Thumbnail, Custom.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", IMGSAN_VERSION);

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan the input folder.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_flag("--no-heuristics", settings.no_heuristics,
                 "Disable every content heuristic.");

    app.add_flag("--digest-names", settings.digest_names,
                 "Name sanitized copies after the short SHA-1 of the source.");

    app.add_flag("--skip-existing", settings.skip_existing,
                 "With --digest-names, skip sources whose digest already exists in the output.");

    // --- Options ---
    app.add_option("-o,--output", settings.output_path,
                   "Write sanitized copies under PATH, mirroring the input tree.");

    app.add_option("--mode", settings.mode,
                   "'sanitize' strips sensitive metadata, 'report' only inspects.\n"
                   "(Default: sanitize when -o is given, report otherwise).")
        ->transform(CLI::IsMember({"sanitize", "report"}, CLI::ignore_case));

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last();

    // calculate default worker count
    settings.workers = static_cast<int>(std::max(1U, std::thread::hardware_concurrency() / 2));
    app.add_option("-w,--workers", settings.workers,
                   "Files processed in parallel.")
        ->default_val(settings.workers)
        ->check(CLI::PositiveNumber);

    app.add_option("--heuristic", settings.heuristics,
                   "Enable only heuristic ID. (Can be used multiple times; default: all).")
        ->check(CLI::IsMember(imgsan::HeuristicRegistry{}.ids()));

    app.add_option("--timeout-ms", settings.timeout_ms,
                   "Per-file time budget in milliseconds (0 = unlimited).")
        ->check(CLI::NonNegativeNumber);

    app.add_option("--hash-sample-size", settings.hash_sample_size,
                   "With --digest-names, hash only the first SIZE bytes (e.g. 512K, 2MB).");

    app.add_option("--keep", settings.keep_categories,
                   "Treat findings of CATEGORY as informational and keep them. (Can be used multiple times).")
        ->check(CategoryValidator());

    app.add_option("--include", settings.include_patterns,
                   "Process only files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not process files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("ERROR")
        ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to a file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One directory and/or image files.")
        ->required()
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        const auto dirs = std::count_if(settings.inputs.begin(), settings.inputs.end(),
                                        [](const auto& p) { return std::filesystem::is_directory(p); });
        if (dirs > 1) {
            throw CLI::ValidationError("At most one input directory can be given.");
        }

        if (settings.mode == "sanitize" && settings.output_path.empty()) {
            throw CLI::ValidationError("Option '-o, --output' is required in sanitize mode.");
        }

        if (settings.mode == "report" && !settings.output_path.empty()) {
            throw CLI::ValidationError("--mode report and -o, --output cannot be used together.");
        }

        if (settings.skip_existing && !settings.digest_names) {
            throw CLI::ValidationError("--skip-existing requires --digest-names.");
        }

        if (!settings.hash_sample_size.empty() && !settings.digest_names) {
            throw CLI::ValidationError("--hash-sample-size requires --digest-names.");
        }

        if (settings.no_heuristics && !settings.heuristics.empty()) {
            throw CLI::ValidationError("--no-heuristics and --heuristic cannot be used together.");
        }
    });
}

imgsan::EngineConfig make_engine_config(const Settings& settings) {
    imgsan::EngineConfig cfg;
    cfg.worker_count = settings.workers;
    cfg.recursive = settings.recursive;
    cfg.include_patterns = settings.include_patterns;
    cfg.exclude_patterns = settings.exclude_patterns;

    for (const auto& in : settings.inputs) {
        if (std::filesystem::is_directory(in)) {
            cfg.source_root = in;
        } else {
            cfg.sources.push_back(in);
        }
    }

    const bool sanitize = settings.mode.empty() ? !settings.output_path.empty() : settings.mode == "sanitize";
    cfg.mode = sanitize ? imgsan::RunMode::Sanitize : imgsan::RunMode::ReportOnly;
    cfg.destination_root = settings.output_path;

    if (settings.no_heuristics) {
        cfg.enabled_heuristics.clear();
    } else if (!settings.heuristics.empty()) {
        cfg.enabled_heuristics = settings.heuristics;
    } else {
        cfg.enabled_heuristics = imgsan::HeuristicRegistry{}.ids();
    }

    if (settings.timeout_ms > 0) {
        cfg.file_timeout = std::chrono::milliseconds(settings.timeout_ms);
    }

    for (const auto& name : settings.keep_categories) {
        if (const auto category = imgsan::parse_category(name)) {
            cfg.rules.set_sensitivity(*category, imgsan::Sensitivity::Informational);
        }
    }

    if (settings.digest_names) {
        cfg.naming = imgsan::OutputNaming::Digest;
        cfg.skip_existing = settings.skip_existing;
        if (!settings.hash_sample_size.empty()) {
            cfg.hash_sample_size = imgsan::parse_size(settings.hash_sample_size);
        }
    }
    return cfg;
}
