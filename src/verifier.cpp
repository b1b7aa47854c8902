#include "verifier.hpp"
#include "shell_command.hpp"
#include <algorithm>
#include <iterator>

std::string toString(VerificationOutcome outcome) {
    switch (outcome) {
        case VerificationOutcome::Match:   return "Match";
        case VerificationOutcome::Deficit: return "Deficit";
        case VerificationOutcome::Surplus: return "Surplus";
    }
    return "Unknown";
}

std::uint64_t VerificationResult::deficit() const {
    return outcome == VerificationOutcome::Deficit ? sourceFileCount - targetFileCount : 0;
}

Verifier::Verifier(const DirectoryProber& prober, const TransferLogger& logger) : prober_(prober), logger_(logger) {}

std::expected<VerificationResult, TransferError> Verifier::verify(RemoteSession& source,
                                                                  RemoteSession& target,
                                                                  const std::string& sourcePath,
                                                                  const std::string& targetPath,
                                                                  bool listMissing) const {
    auto fail = [](const std::string& message) {
        return std::unexpected(TransferError{TransferErrorKind::VerificationDeficit, message});
    };

    VerificationResult result;
    struct Side {
        RemoteSession& session;
        const std::string& path;
        std::uint64_t& files;
        std::uint64_t& dirs;
    };
    for (Side side : {Side{source, sourcePath, result.sourceFileCount, result.sourceDirCount},
                      Side{target, targetPath, result.targetFileCount, result.targetDirCount}}) {
        auto files = prober_.fileCount(side.session, side.path);
        if (!files) {
            return fail("Could not count files on " + side.session.host() + ":" + side.path + ": " + files.error());
        }
        auto dirs = prober_.directoryCount(side.session, side.path);
        if (!dirs) {
            return fail("Could not count directories on " + side.session.host() + ":" + side.path + ": " +
                        dirs.error());
        }
        side.files = *files;
        side.dirs = *dirs > 0 ? *dirs - 1 : 0;
    }

    logger_.info("Source: " + std::to_string(result.sourceFileCount) + " files, " +
                 std::to_string(result.sourceDirCount) + " directories");
    logger_.info("Target: " + std::to_string(result.targetFileCount) + " files, " +
                 std::to_string(result.targetDirCount) + " directories");

    if (result.targetFileCount == result.sourceFileCount) {
        result.outcome = VerificationOutcome::Match;
        logger_.info("File count verification successful");
        return result;
    }
    if (result.targetFileCount > result.sourceFileCount) {
        result.outcome = VerificationOutcome::Surplus;
        logger_.warning("Target has " + std::to_string(result.targetFileCount - result.sourceFileCount) +
                        " extra files");
        return result;
    }

    result.outcome = VerificationOutcome::Deficit;
    logger_.warning("Transfer incomplete: " + std::to_string(result.deficit()) + " files missing");
    if (!listMissing) {
        return result;
    }

    auto sourceFiles = listFiles(source, sourcePath);
    if (!sourceFiles) {
        return fail("Could not list files on " + source.host() + ":" + sourcePath + ": " + sourceFiles.error());
    }
    auto targetFiles = listFiles(target, targetPath);
    if (!targetFiles) {
        return fail("Could not list files on " + target.host() + ":" + targetPath + ": " + targetFiles.error());
    }

    std::set_difference(sourceFiles->begin(), sourceFiles->end(), targetFiles->begin(), targetFiles->end(),
                        std::inserter(result.missing, result.missing.end()));
    logger_.info("Identified " + std::to_string(result.missing.size()) + " missing files");
    for (const auto& path : result.missing) {
        logger_.debug("Missing: " + path);
    }
    return result;
}

std::expected<MissingFileSet, std::string> Verifier::listFiles(RemoteSession& session, const std::string& path) const {
    ShellCommand find("find");
    find.arg(path).arg("-type").arg("f").arg("-printf").arg("%P\\0");
    logger_.debug("[" + session.host() + "] " + find.redacted());

    auto result = session.execute(find.str(), prober_.timeout());
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        return std::unexpected("exit code " + std::to_string(result->exitCode) +
                               (result->err.empty() ? "" : ": " + result->err));
    }
    return parseNulSeparated(result->out);
}

MissingFileSet Verifier::parseNulSeparated(const std::string& output) {
    MissingFileSet entries;
    std::string::size_type start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        if (end > start) {
            entries.insert(output.substr(start, end - start));
        }
        start = end + 1;
    }
    return entries;
}
