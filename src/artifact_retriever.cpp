#include "artifact_retriever.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <regex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {

const std::regex& progressPattern() {
    static const std::regex pattern(
        R"((\d+)%\[([-=<>\s]*)\]\s+([0-9.,]+[KMGT]?)\s+([0-9.,]+[KMGT]?B/s)\s*(?:eta\s+([0-9dhms\s]*[0-9dhms]))?)");
    return pattern;
}

const std::regex& progressShapePattern() {
    // Bar style "45%[==>   ]" or dot style "  1024K .......... .......... 50%".
    static const std::regex pattern(R"(\d+%\[|^\s*\d+[KMGT]\s+\.)");
    return pattern;
}

template <typename Integer>
std::optional<Integer> parseDigits(const std::string& digits) {
    Integer value{};
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

std::string percentEncodePath(std::string_view path) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (char c : path) {
        auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += c;
        } else {
            out += '%';
            out += hex[byte >> 4];
            out += hex[byte & 0x0F];
        }
    }
    return out;
}

std::string trimmed(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(begin, end - begin + 1));
}

} // namespace

std::optional<double> parseSizeToken(std::string_view token) {
    if (token.size() >= 3 && token.substr(token.size() - 3) == "B/s") {
        token.remove_suffix(3);
    }
    if (token.empty()) {
        return std::nullopt;
    }

    double multiplier = 1.0;
    switch (token.back()) {
        case 'K': multiplier = 1024.0; break;
        case 'M': multiplier = 1024.0 * 1024.0; break;
        case 'G': multiplier = 1024.0 * 1024.0 * 1024.0; break;
        case 'T': multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0; break;
        default: break;
    }
    if (multiplier > 1.0) {
        token.remove_suffix(1);
    }

    std::string number(token);
    std::replace(number.begin(), number.end(), ',', '.');
    if (number.empty() || number.find_first_not_of("0123456789.") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stod(number) * multiplier;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> parseEtaToken(std::string_view token) {
    static const std::regex part(R"((\d+)([dhms]))");
    std::string text(token);
    std::uint64_t seconds = 0;
    bool matched = false;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), part); it != std::sregex_iterator(); ++it) {
        auto value = parseDigits<std::uint64_t>((*it)[1].str());
        if (!value) {
            return std::nullopt;
        }
        std::uint64_t unit = 1;
        switch ((*it)[2].str()[0]) {
            case 'd': unit = 86400; break;
            case 'h': unit = 3600; break;
            case 'm': unit = 60; break;
            default:  break;
        }
        constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
        if (*value > (kMax - seconds) / unit) {
            return std::nullopt;
        }
        seconds += *value * unit;
        matched = true;
    }
    if (!matched) {
        return std::nullopt;
    }
    return seconds;
}

std::optional<ProgressSample> parseProgressLine(std::string_view line) {
    std::string text(line);
    std::smatch match;
    if (!std::regex_search(text, match, progressPattern())) {
        return std::nullopt;
    }

    auto percent = parseDigits<int>(match[1].str());
    if (!percent || *percent > 100) {
        return std::nullopt;
    }

    ProgressSample sample;
    sample.fractionComplete = *percent / 100.0;
    sample.sizeToken = match[3].str();
    sample.rateToken = match[4].str();

    auto bytes = parseSizeToken(sample.sizeToken);
    auto rate = parseSizeToken(sample.rateToken);
    if (!bytes || !rate || *bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        return std::nullopt;
    }
    sample.bytesTransferred = static_cast<std::uint64_t>(std::llround(*bytes));
    sample.rateBytesPerSec = *rate;

    if (match[5].matched) {
        sample.etaToken = trimmed(match[5].str());
        sample.etaSeconds = parseEtaToken(*sample.etaToken);
    }
    return sample;
}

bool looksLikeProgress(std::string_view line) {
    std::string text(line);
    return std::regex_search(text, progressShapePattern());
}

std::vector<std::string> LineSplitter::feed(std::string_view data) {
    std::vector<std::string> lines;
    for (char c : data) {
        if (c == '\r' || c == '\n') {
            if (!pending_.empty()) {
                lines.push_back(std::move(pending_));
                pending_.clear();
            }
        } else {
            pending_ += c;
        }
    }
    return lines;
}

std::optional<std::string> LineSplitter::flush() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(pending_);
    pending_.clear();
    return line;
}

ArtifactRetriever::ArtifactRetriever(const TransferLogger& logger, ProgressObserver* observer, RetrieverOptions options)
    : logger_(logger), observer_(observer), options_(std::move(options)) {}

std::string ArtifactRetriever::targetArtifactPath(const ArchiveDescriptor& descriptor,
                                                  const std::string& targetHome) const {
    return joinRemotePath(resolveRemotePath(targetHome, options_.stagingDir), descriptor.fileName);
}

std::string ArtifactRetriever::sourceUrl(const BulkTransferSource& source, const ArchiveDescriptor& descriptor) const {
    std::string path = options_.stagingDir;
    if (!source.pathPrefix.empty()) {
        path = joinRemotePath(source.pathPrefix, path);
    }
    path = joinRemotePath(path, descriptor.fileName);
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    return "ftp://" + source.host + ":" + std::to_string(source.port) + "/" + percentEncodePath(path);
}

ShellCommand ArtifactRetriever::buildCommand(const BulkTransferSource& source,
                                             const ArchiveDescriptor& descriptor,
                                             const std::string& targetStaging) const {
    ShellCommand wget("wget");
    wget.arg("--progress=bar:force")
        .arg("--timeout=" + std::to_string(options_.networkTimeout))
        .arg("--tries=" + std::to_string(options_.tries))
        .arg("--ftp-user=" + source.username)
        .secretArg("--ftp-password=" + source.password)
        .arg("-O")
        .arg(descriptor.fileName)
        .arg(sourceUrl(source, descriptor));

    ShellCommand command("cd");
    command.arg(targetStaging).then(wget);
    return command;
}

std::expected<RetrievalResult, TransferError> ArtifactRetriever::retrieve(RemoteSession& target,
                                                                          const BulkTransferSource& source,
                                                                          const ArchiveDescriptor& descriptor,
                                                                          const std::string& targetHome) const {
    auto fail = [](const std::string& message) {
        return std::unexpected(TransferError{TransferErrorKind::RetrievalError, message});
    };

    const std::string staging = resolveRemotePath(targetHome, options_.stagingDir);
    ShellCommand mkdir("mkdir");
    mkdir.arg("-p").arg(staging);
    auto prepared = target.execute(mkdir.str(), options_.commandTimeout);
    if (!prepared) {
        return fail("Failed to create staging directory " + target.host() + ":" + staging + ": " + prepared.error());
    }
    if (!prepared->succeeded()) {
        return fail("Failed to create staging directory " + target.host() + ":" + staging + ": exit code " +
                    std::to_string(prepared->exitCode));
    }

    ShellCommand command = buildCommand(source, descriptor, staging);
    logger_.info("Downloading " + descriptor.fileName + " from " + source.host + " to " + target.host());
    logger_.debug("[" + target.host() + "] " + command.redacted());

    auto started = target.executeStreaming(command.str());
    if (!started) {
        return fail("Failed to start download on " + target.host() + ": " + started.error());
    }
    RemoteExecution& execution = **started;

    RetrievalResult result;
    std::vector<std::string> diagnostics;
    LineSplitter outLines;
    LineSplitter errLines;
    const auto startTime = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> lastLogged;

    auto handleLine = [&](const std::string& line) {
        if (auto sample = parseProgressLine(line)) {
            ++result.sampleCount;
            if (observer_) {
                observer_->onProgress(*sample);
            }
            auto now = std::chrono::steady_clock::now();
            if (!lastLogged || now - *lastLogged >= options_.logInterval) {
                logger_.info(ConsoleProgressObserver::formatSample(*sample));
                lastLogged = now;
            }
            result.lastSample = std::move(*sample);
        } else if (!looksLikeProgress(line)) {
            std::string text = trimmed(line);
            if (!text.empty()) {
                logger_.debug("[wget] " + text);
                diagnostics.push_back(std::move(text));
            }
        }
    };

    auto consume = [&](const OutputChunk& chunk) {
        for (const auto& line : errLines.feed(chunk.err)) {
            handleLine(line);
        }
        for (const auto& line : outLines.feed(chunk.out)) {
            handleLine(line);
        }
    };

    auto finishObserver = [&]() {
        if (observer_) {
            observer_->onFinished();
        }
    };

    while (true) {
        auto chunk = execution.readAvailable();
        if (!chunk) {
            finishObserver();
            return fail("Lost connection to " + target.host() + " during download: " + chunk.error());
        }
        consume(*chunk);

        if (execution.exitStatusReady()) {
            break;
        }
        if (std::chrono::steady_clock::now() - startTime > options_.timeout) {
            finishObserver();
            return fail("Download of " + descriptor.fileName + " timed out after " +
                        std::to_string(options_.timeout.count()) + " s");
        }
        if (chunk->empty()) {
            if (options_.sleep) {
                options_.sleep(options_.pollInterval);
            } else {
                std::this_thread::sleep_for(options_.pollInterval);
            }
        }
    }

    auto tail = execution.readAvailable();
    if (tail) {
        consume(*tail);
    } else {
        logger_.warning("Could not drain download output on " + target.host() + ": " + tail.error());
    }
    for (auto* splitter : {&errLines, &outLines}) {
        if (auto line = splitter->flush()) {
            handleLine(*line);
        }
    }
    finishObserver();

    auto status = execution.finish();
    if (!status) {
        return fail("Download on " + target.host() + " ended without exit status: " + status.error());
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);

    if (*status != 0) {
        std::string message = "Failed to download " + descriptor.fileName + " (wget exit code " +
                              std::to_string(*status) + ")";
        if (!diagnostics.empty()) {
            constexpr std::size_t kMaxDiagnosticLines = 10;
            auto first = diagnostics.size() > kMaxDiagnosticLines ? diagnostics.end() - kMaxDiagnosticLines
                                                                  : diagnostics.begin();
            std::string detail;
            for (auto it = first; it != diagnostics.end(); ++it) {
                detail += (detail.empty() ? "" : " | ") + *it;
            }
            message += ": " + detail;
        }
        return fail(message);
    }

    result.artifact = descriptor;
    result.artifact.remotePath = joinRemotePath(staging, descriptor.fileName);
    result.artifact.fileListPath.clear();
    logger_.info("Download completed: " + target.host() + ":" + result.artifact.remotePath);
    return result;
}
