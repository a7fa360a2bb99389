#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/stop_forwarder.hpp"
#include "../../libimgsan/include/error.hpp"
#include "../../libimgsan/include/event_bus.hpp"
#include "../../libimgsan/include/events.hpp"
#include "../../libimgsan/include/logger.hpp"
#include "../../libimgsan/include/sanitize_engine.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace imgsan;

static std::atomic<bool> interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

// handle ctrl+c or termination signals; StopForwarder relays the flag to the engine
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

int main(int argc, char* argv[]) {

    CLI::App app{"imgsan: strips privacy-sensitive metadata from JPEG and PNG images."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    Logger logger;
    // the file sink records everything, the console honours --log-level
    if (settings.log_file.empty()) {
        logger.set_min_level(Logger::string_to_level(settings.log_level));
    } else {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!file_sink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 2;
        }
        logger.add_sink(std::move(file_sink));
    }
    if (!settings.quiet && settings.log_level != "NONE") {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = Logger::string_to_level(settings.log_level);
        logger.add_sink(std::move(console_sink));
    }

    EventBus bus;
    std::size_t total = 0;
    std::size_t done = 0;
    const auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<RunStartEvent>([&](const RunStartEvent& e) {
        total = e.total;
    });

    // the bus serializes handlers, so the counters need no extra locking
    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        ++done;
        if (settings.quiet) return;
        if (e.action == FileAction::Failed) {
            std::cerr << RED << "\n[FAIL] " << e.path.filename().string() << RESET << std::endl;
        }
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_total).count();
        print_progress_bar(done, total, elapsed);
    });

    std::unique_ptr<SanitizeEngine> engine;
    try {
        engine = std::make_unique<SanitizeEngine>(make_engine_config(settings), logger, &bus);
    } catch (const ConfigError& e) {
        std::cerr << RED << "Configuration error: " << e.what() << RESET << std::endl;
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::optional<Report> report;
    {
        const StopForwarder forwarder(interrupted, [&engine] { engine->request_stop(); });
        try {
            report.emplace(engine->run());
        } catch (const std::exception& e) {
            logger.log(LogLevel::Error, std::string("Run aborted: ") + e.what(), "main");
            std::cerr << RED << "Run aborted: " << e.what() << RESET << std::endl;
        }
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    if (!report) {
        return 1;
    }

    if (interrupted.load() && !settings.quiet) {
        std::cerr << CYAN << "\n[INTERRUPT] Stop detected. In-flight files were finished." << RESET << std::endl;
    }
    if (!settings.quiet) {
        if (total > 0) std::cerr << "\n";
        print_console_report(*report);
    }

    if (!settings.report_path.empty()) {
        if (!export_csv_report(*report, settings.report_path)) {
            logger.log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
        }
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return report->summary().failed > 0 ? 1 : 0;
}
