#include "../../include/sanitizer.hpp"
#include "../../include/content_scanner.hpp"
#include "../../include/deadline.hpp"
#include "../../include/digest.hpp"
#include "../../include/error.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/metadata_inspector.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>

namespace imgsan {

namespace {

bool is_under(const std::filesystem::path& path, const std::filesystem::path& root) {
    const auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    return !rel.empty() && *rel.begin() != "..";
}

void fail(FileResult& result, const ErrorKind kind, std::string message) {
    result.action = FileAction::Failed;
    result.error = FileError{kind, std::move(message)};
}

void merge_heuristic_findings(std::vector<Finding>& findings, std::vector<Finding> extra) {
    for (auto& finding : extra) {
        const bool seen = std::any_of(findings.begin(), findings.end(),
                                      [&](const Finding& f) { return f.tag() == finding.tag(); });
        if (!seen) findings.push_back(std::move(finding));
    }
}

} // namespace

std::filesystem::path destination_for(const std::filesystem::path& source,
                                      const EngineConfig& config,
                                      const std::optional<std::string>& digest) {
    std::filesystem::path rel = source.filename();
    if (!config.source_root.empty() && is_under(source, config.source_root)) {
        rel = source.lexically_normal().lexically_relative(config.source_root.lexically_normal());
    }
    auto dest = config.destination_root / rel;
    if (digest) {
        auto ext = source.extension().string();
        std::ranges::transform(ext, ext.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        dest = dest.parent_path() / (*digest + ext);
    }
    return dest;
}

FileResult Sanitizer::process(const std::filesystem::path& path, const EngineContext& ctx) const {
    const auto start = std::chrono::steady_clock::now();
    const EngineConfig& cfg = ctx.config;
    const Deadline deadline(cfg.file_timeout);

    FileResult result;
    result.source = path;

    auto done = [&]() -> FileResult {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (result.action == FileAction::Failed) {
            ctx.logger.log(LogLevel::Warning,
                           "Failed (" + std::string(to_string(result.error->kind)) + "): " +
                           path.string() + ": " + result.error->message, "sanitizer");
        }
        return std::move(result);
    };
    auto timed_out = [&]() {
        if (!deadline.expired()) return false;
        fail(result, ErrorKind::Timeout,
             "file timeout of " + std::to_string(cfg.file_timeout->count()) + " ms exceeded");
        return true;
    };

    // 1. codec
    result.mime = MimeDetector::detect(path);
    const IImageCodec* codec = ctx.codecs.resolve(path, result.mime);
    if (!codec) {
        result.notes.push_back("unsupported format (" + (result.mime.empty() ? "unknown" : result.mime) + ")");
        ctx.logger.log(LogLevel::Debug, "Skipped (unsupported " + result.mime + "): " + path.string(), "sanitizer");
        return done();
    }

    // 2. digest naming
    std::optional<std::string> digest;
    if (cfg.mode == RunMode::Sanitize && cfg.naming == OutputNaming::Digest) {
        try {
            digest = short_digest(path, cfg.hash_sample_size);
        } catch (const Error& e) {
            fail(result, ErrorKind::Decode, e.what());
            return done();
        }
        if (cfg.skip_existing && ctx.existing_digests.contains(*digest)) {
            result.notes.emplace_back("already present in destination");
            ctx.logger.log(LogLevel::Debug, "Skipped (digest " + *digest + " exists): " + path.string(), "sanitizer");
            return done();
        }
    }
    if (timed_out()) return done();

    // 3. decode
    std::unique_ptr<ImageHandle> handle;
    try {
        handle = codec->decode(path);
    } catch (const DecodeError& e) {
        fail(result, ErrorKind::Decode, e.what());
        return done();
    }
    if (timed_out()) return done();

    // 4. inspect + scan
    try {
        result.findings = MetadataInspector(cfg.rules).inspect(*codec, *handle);
    } catch (const DecodeError& e) {
        fail(result, ErrorKind::Decode, e.what());
        return done();
    }
    if (timed_out()) return done();

    auto outcome = ContentScanner(ctx.heuristics, ctx.logger)
                       .scan(*handle, cfg.enabled_heuristics, cfg.rules, deadline);
    merge_heuristic_findings(result.findings, std::move(outcome.findings));
    result.notes.insert(result.notes.end(), outcome.notes.begin(), outcome.notes.end());
    if (outcome.timed_out && timed_out()) return done();

    // 5. report only
    if (cfg.mode == RunMode::ReportOnly) {
        result.action = FileAction::RecordedOnly;
        ctx.logger.log(LogLevel::Debug, "Recorded " + std::to_string(result.findings.size()) +
                                        " finding(s): " + path.string(), "sanitizer");
        return done();
    }

    // 6. strip
    std::set<std::string> keys;
    for (const auto& f : result.findings) {
        if (f.is_sensitive()) keys.insert(f.tag());
    }
    const auto dest = destination_for(path, cfg, digest);
    result.destination = dest;
    if (timed_out()) return done();

    try {
        ensure_directory(dest.parent_path());
        result.removed_tags = codec->write_stripped_copy(*handle, keys, dest);
    } catch (const WriteError& e) {
        fail(result, ErrorKind::Write, e.what());
        return done();
    }

    result.action = FileAction::Stripped;
    ctx.logger.log(LogLevel::Info, "Sanitized " + path.string() + " -> " + dest.string() + " (" +
                                   std::to_string(result.removed_tags.size()) + " removed)", "sanitizer");
    return done();
}

} // namespace imgsan
