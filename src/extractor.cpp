#include "extractor.hpp"
#include "shell_command.hpp"
#include <sstream>

Extractor::Extractor(const TransferLogger& logger, std::chrono::seconds timeout, std::chrono::seconds commandTimeout)
    : logger_(logger), timeout_(timeout), commandTimeout_(commandTimeout) {}

std::expected<ExtractResult, TransferError> Extractor::extract(RemoteSession& target,
                                                              const ArchiveDescriptor& artifact,
                                                              const std::string& destinationParent) const {
    ShellCommand mkdir("mkdir");
    mkdir.arg("-p").arg(destinationParent);
    auto created = target.execute(mkdir.str(), commandTimeout_);
    if (!created || !created->succeeded()) {
        std::string reason = created ? "exit code " + std::to_string(created->exitCode) + ": " + created->err
                                     : created.error();
        return std::unexpected(TransferError{TransferErrorKind::ExtractError,
                                             "Failed to create " + target.host() + ":" + destinationParent + ": " +
                                                 reason});
    }

    ShellCommand tar("tar");
    tar.arg("-xzvf").arg(artifact.remotePath).arg("-C").arg(destinationParent);
    logger_.info("Extracting " + artifact.fileName + " into " + target.host() + ":" + destinationParent);
    logger_.debug("[" + target.host() + "] " + tar.redacted());

    auto result = target.execute(tar.str(), timeout_);
    if (!result) {
        return std::unexpected(TransferError{TransferErrorKind::ExtractError,
                                             "Failed to extract " + artifact.fileName + ": " + result.error()});
    }
    if (!result->succeeded()) {
        logger_.error("tar exited with code " + std::to_string(result->exitCode) + " on " + target.host());
        logger_.error("Stdout: " + result->out);
        logger_.error("Stderr: " + result->err);
        return std::unexpected(TransferError{TransferErrorKind::ExtractError,
                                             "Failed to extract " + artifact.fileName + " (exit code " +
                                                 std::to_string(result->exitCode) + "): " + result->err});
    }

    ExtractResult extracted;
    extracted.destination = destinationParent;
    std::istringstream lines(result->out);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            ++extracted.entries;
        }
    }
    logger_.info("Archive extracted: " + std::to_string(extracted.entries) + " entries");
    return extracted;
}
