#include "report_generator.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

using imgsan::FileAction;
using imgsan::FileResult;

namespace {

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

std::string outcome_label(const FileResult& r) {
    switch (r.action) {
        case FileAction::Stripped:     return "STRIPPED";
        case FileAction::RecordedOnly: return "RECORDED";
        case FileAction::Skipped:      return "SKIPPED";
        case FileAction::Failed:
            return "FAIL (" + std::string(r.error ? to_string(r.error->kind) : "internal") + ")";
    }
    return "";
}

std::string colored(const std::string& label, const FileResult& r, const bool use_colors) {
    if (!use_colors) return label;
    const char* color = "";
    switch (r.action) {
        case FileAction::Stripped:     color = "\033[1;32m"; break;
        case FileAction::RecordedOnly: color = r.sensitive_count() ? "\033[1;33m" : ""; break;
        case FileAction::Skipped:      color = "\033[1;36m"; break;
        case FileAction::Failed:       color = "\033[1;31m"; break;
    }
    return *color ? std::string(color) + label + "\033[0m" : label;
}

std::string detail(const FileResult& r) {
    if (r.error) return r.error->message;
    std::string out;
    for (const auto& note : r.notes) {
        if (!out.empty()) out += "; ";
        out += note;
    }
    return out;
}

std::string seconds(const std::chrono::milliseconds ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(ms.count()) / 1000.0;
    return oss.str();
}

} // namespace

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string format_findings(const FileResult& result) {
    std::string out;
    for (const auto& f : result.findings) {
        if (!out.empty()) out += "; ";
        out += f.tag() + "=" + std::string(to_string(f.category())) + "/" + std::string(to_string(f.sensitivity()));
    }
    return out;
}

void print_console_report(const imgsan::Report& report) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    std::size_t max_mime = 12;
    std::size_t max_result = 10;
    std::size_t max_findings = 10;
    std::size_t max_removed = 9;
    std::size_t max_time = 9;
    for (const auto& r : report.results()) {
        max_mime = std::max(max_mime, r.mime.size() + 2);
        max_result = std::max(max_result, outcome_label(r).size() + 2);
    }

    const std::size_t fixed_cols_width = max_mime + max_result + max_findings + max_removed + max_time + 20;
    const std::size_t file_col_width = term_width > fixed_cols_width + 10 ? term_width - fixed_cols_width : 24;

    auto truncate = [](const std::string& s, const std::size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_mime)) << "MIME type"
              << std::setw(static_cast<int>(max_result)) << "Result"
              << std::setw(static_cast<int>(max_findings)) << "Sens/All"
              << std::setw(static_cast<int>(max_removed)) << "Removed"
              << std::setw(static_cast<int>(max_time)) << "Time(s)"
              << "Error / note"
              << "\n";

    for (const auto& r : report.results()) {
        const std::string label = outcome_label(r);
        // pad before colouring so escape codes do not break alignment
        std::string padded = label;
        padded.resize(std::max(padded.size(), max_result), ' ');
        const std::string counts = std::to_string(r.sensitive_count()) + "/" + std::to_string(r.findings.size());

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.source.filename().string(), file_col_width - 1)
                  << std::setw(static_cast<int>(max_mime)) << r.mime
                  << colored(padded, r, use_colors)
                  << std::setw(static_cast<int>(max_findings)) << counts
                  << std::setw(static_cast<int>(max_removed)) << r.removed_tags.size()
                  << std::setw(static_cast<int>(max_time)) << seconds(r.duration)
                  << strip_ansi(detail(r))
                  << "\n";
    }

    const auto& s = report.summary();
    std::cerr << "\nScanned: " << s.scanned
              << "  Sanitized: " << s.sanitized
              << "  Recorded: " << s.recorded
              << "  Failed: " << s.failed
              << "  Skipped: " << s.skipped
              << "\nSensitive findings: " << s.sensitive_findings << "\n";
    if (report.cancelled_early()) {
        std::cerr << (use_colors ? "\033[1;33m" : "") << "Run cancelled before every file was processed."
                  << (use_colors ? "\033[0m" : "") << "\n";
    }
    std::cerr << "Total time: " << seconds(report.duration()) << " s (" << report.worker_count()
              << " worker" << (report.worker_count() > 1 ? "s" : "") << ", mode "
              << to_string(report.mode()) << ")\n";
}

bool export_csv_report(const imgsan::Report& report, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Destination,MIME,Result,Findings,Sensitive,Removed,Time(s),Error,Notes,Details\n";

    for (const auto& r : report.results()) {
        std::string notes;
        for (const auto& note : r.notes) {
            if (!notes.empty()) notes += "; ";
            notes += note;
        }
        std::string removed;
        for (const auto& key : r.removed_tags) {
            if (!removed.empty()) removed += "; ";
            removed += key;
        }

        out << csv_escape(r.source.string()) << ","
            << csv_escape(r.destination ? r.destination->string() : "") << ","
            << csv_escape(r.mime) << ","
            << csv_escape(outcome_label(r)) << ","
            << r.findings.size() << ","
            << r.sensitive_count() << ","
            << csv_escape(removed) << ","
            << seconds(r.duration) << ","
            << csv_escape(r.error ? r.error->message : "") << ","
            << csv_escape(notes) << ","
            << csv_escape(format_findings(r)) << "\n";
    }

    const auto& s = report.summary();
    out << "\n\nScanned,Sanitized,Recorded,Failed,Skipped,Sensitive findings,Cancelled,Total time(s),Mode\n";
    out << s.scanned << "," << s.sanitized << "," << s.recorded << "," << s.failed << ","
        << s.skipped << "," << s.sensitive_findings << ","
        << (report.cancelled_early() ? "yes" : "no") << ","
        << seconds(report.duration()) << "," << to_string(report.mode()) << "\n";

    return static_cast<bool>(out);
}
