#include "directory_prober.hpp"
#include <cctype>
#include <stdexcept>

DirectoryProber::DirectoryProber(const TransferLogger& logger, std::chrono::seconds timeout)
    : logger_(logger), timeout_(timeout) {}

ProbeOutcome DirectoryProber::probe(RemoteSession& session, const std::string& path) const {
    ProbeOutcome outcome;

    auto degrade = [&](const std::string& what, const std::string& reason) {
        TransferError error{TransferErrorKind::ProbeDegraded,
                            "Could not determine " + what + " of " + session.host() + ":" + path + " (" + reason +
                                "), using 0"};
        logger_.warning(error.message);
        outcome.degraded.push_back(error);
    };

    if (auto size = totalSize(session, path)) {
        outcome.snapshot.totalSizeBytes = *size;
    } else {
        degrade("size", size.error());
    }

    if (auto files = fileCount(session, path)) {
        outcome.snapshot.fileCount = *files;
    } else {
        degrade("file count", files.error());
    }

    if (auto dirs = directoryCount(session, path)) {
        outcome.snapshot.dirCount = *dirs;
    } else {
        degrade("directory count", dirs.error());
    }

    logger_.info("Probed " + session.host() + ":" + path + ": " + std::to_string(outcome.snapshot.totalSizeBytes) +
                 " bytes, " + std::to_string(outcome.snapshot.fileCount) + " files, " +
                 std::to_string(outcome.snapshot.dirCount) + " directories");
    return outcome;
}

std::expected<std::uint64_t, std::string> DirectoryProber::totalSize(RemoteSession& session,
                                                                     const std::string& path) const {
    ShellCommand command("du");
    command.arg("-sb").arg(path).raw("2>/dev/null").pipe(ShellCommand("cut").arg("-f1"));
    return runCount(session, command);
}

std::expected<std::uint64_t, std::string> DirectoryProber::fileCount(RemoteSession& session,
                                                                     const std::string& path) const {
    return runCount(session, countCommand(path, "f"));
}

std::expected<std::uint64_t, std::string> DirectoryProber::directoryCount(RemoteSession& session,
                                                                          const std::string& path) const {
    return runCount(session, countCommand(path, "d"));
}

std::optional<std::uint64_t> DirectoryProber::parseCount(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    auto end = text.find_last_not_of(" \t\r\n");
    std::string digits = text.substr(begin, end - begin + 1);
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    try {
        return std::stoull(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

ShellCommand DirectoryProber::countCommand(const std::string& path, const std::string& type) const {
    ShellCommand command("find");
    command.arg(path).arg("-type").arg(type).raw("2>/dev/null").pipe(ShellCommand("wc").arg("-l"));
    return command;
}

std::expected<std::uint64_t, std::string> DirectoryProber::runCount(RemoteSession& session,
                                                                    const ShellCommand& command) const {
    logger_.debug("[" + session.host() + "] " + command.redacted());
    auto result = session.execute(command.str(), timeout_);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        return std::unexpected("exit code " + std::to_string(result->exitCode));
    }
    auto value = parseCount(result->out);
    if (!value) {
        return std::unexpected("unexpected output '" + result->out + "'");
    }
    return *value;
}
