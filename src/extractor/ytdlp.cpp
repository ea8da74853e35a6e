#include "vdl/extractor.hpp"
#include "vdl/log.hpp"
#include "vdl/platform.hpp"

#include <sstream>

namespace vdl {

namespace {

constexpr size_t kLogExcerptLimit = 4000;

std::string tail(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return "..." + text.substr(text.size() - limit);
}

std::string first_line(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find('\n', start);
    std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

std::string process_failure(const ProcessResult& proc, const std::string& binary) {
    if (!proc.ok) {
        return "failed to run " + binary + ": " + proc.error;
    }
    if (proc.timed_out) {
        return binary + " timed out";
    }
    if (proc.exit_code == 127) {
        return binary + " is not installed or not on PATH";
    }
    std::string reason = first_line(proc.err);
    if (reason.empty()) {
        reason = "exit code " + std::to_string(proc.exit_code);
    }
    return binary + " failed: " + reason;
}

} // namespace

std::vector<std::string> build_info_command(const ExtractorSettings& settings,
                                            const std::string& url, bool flat_playlist) {
    std::vector<std::string> argv{settings.binary, "-J", "--no-warnings"};
    if (flat_playlist) {
        argv.push_back("--flat-playlist");
    }
    argv.push_back("--");
    argv.push_back(url);
    return argv;
}

std::vector<std::string> build_download_command(const ExtractorSettings& settings,
                                                const DownloadRequest& request) {
    std::vector<std::string> argv{settings.binary};
    if (request.format_id && !request.format_id->empty()) {
        argv.push_back("-f");
        argv.push_back(*request.format_id);
    }
    if (request.max_filesize > 0) {
        argv.push_back("--max-filesize");
        argv.push_back(std::to_string(request.max_filesize));
    }
    argv.push_back("-o");
    argv.push_back(request.destination_template);
    argv.push_back("--print");
    argv.push_back("after_move:filepath");
    argv.push_back("--no-simulate");
    argv.push_back("--");
    argv.push_back(request.url);
    return argv;
}

std::vector<std::string> parse_printed_filepaths(const std::string& stdout_text) {
    std::vector<std::string> paths;
    std::istringstream in(stdout_text);
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        if (!line.empty()) {
            paths.push_back(line);
        }
    }
    return paths;
}

ExtractionEngine make_ytdlp_engine(const ExtractorSettings& settings) {
    ExtractionEngine engine;

    engine.available = [settings]() {
        auto proc = run_process({settings.binary, "--version"}, settings.info_timeout_seconds);
        if (!proc.ok || proc.timed_out || proc.exit_code != 0) {
            spdlog::debug("{} unavailable: {}", settings.binary, process_failure(proc, settings.binary));
            return false;
        }
        spdlog::debug("{} version {}", settings.binary, first_line(proc.out));
        return true;
    };

    engine.extract_info = [settings](const std::string& url, bool flat_playlist) {
        InfoResult result;
        auto proc = run_process(build_info_command(settings, url, flat_playlist),
                                settings.info_timeout_seconds);
        if (!proc.ok || proc.timed_out || proc.exit_code != 0) {
            result.error = process_failure(proc, settings.binary);
            spdlog::debug("info extraction failed for {}: {}", url, result.error);
            return result;
        }

        try {
            result.info = nlohmann::json::parse(proc.out);
        } catch (const nlohmann::json::parse_error& e) {
            result.error = std::string("unreadable metadata from ") + settings.binary + ": " + e.what();
            return result;
        }
        if (!result.info.is_object()) {
            result.error = "unexpected metadata document from " + settings.binary;
            return result;
        }

        result.ok = true;
        return result;
    };

    engine.download = [settings](const DownloadRequest& request) {
        DownloadResult result;

        download_logger()->info("starting download of {}", request.url);
        auto proc = run_process(build_download_command(settings, request));

        std::string log = proc.out;
        if (!proc.err.empty()) {
            if (!log.empty() && log.back() != '\n') log += '\n';
            log += proc.err;
        }
        result.log = tail(log, kLogExcerptLimit);

        if (!proc.ok || proc.timed_out || proc.exit_code != 0) {
            result.error = process_failure(proc, settings.binary);
            download_logger()->warn("download of {} failed: {}", request.url, result.error);
            return result;
        }

        result.file_paths = parse_printed_filepaths(proc.out);
        result.success = true;
        download_logger()->info("finished download of {}", request.url);
        return result;
    };

    return engine;
}

} // namespace vdl
