#include "archive_packer.hpp"
#include "directory_prober.hpp"
#include "shell_command.hpp"
#include <chrono>
#include <ctime>
#include <utility>

namespace {

// Keeps each printf invocation well below common ARG_MAX limits.
constexpr std::size_t kListChunkBytes = 32 * 1024;
constexpr std::size_t kListChunkEntries = 200;

std::string describeFailure(const CommandResult& result) {
    std::string detail = result.err.empty() ? result.out : result.err;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    return "exit code " + std::to_string(result.exitCode) + (detail.empty() ? "" : ": " + detail);
}

} // namespace

ArchivePacker::ArchivePacker(const TransferLogger& logger, PackerOptions options)
    : logger_(logger), options_(std::move(options)) {}

std::string ArchivePacker::stagingDirectory(const std::string& baseHome) const {
    return resolveRemotePath(baseHome, options_.stagingDir);
}

std::string ArchivePacker::archiveName(const std::string& stem, const std::string& timestamp) {
    return sanitizeArchiveName(stem + "_" + timestamp + ".tar.gz");
}

std::string ArchivePacker::currentTimestamp() const {
    if (options_.timestamp) {
        return options_.timestamp();
    }
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y%m%d_%H%M%S", std::localtime(&timeT));
    return timeBuf;
}

std::expected<ArchiveDescriptor, TransferError> ArchivePacker::plan(const std::string& baseHome,
                                                                    const std::string& path) const {
    std::string absolute = resolveRemotePath(baseHome, path);
    auto [parent, leaf] = splitRemotePath(absolute);
    if (leaf.empty() || leaf == "." || leaf == "..") {
        return std::unexpected(TransferError{TransferErrorKind::PackError,
                                             "Cannot archive '" + path + "': path has no directory name"});
    }

    ArchiveDescriptor descriptor;
    descriptor.fileName = archiveName(leaf, currentTimestamp());
    descriptor.remotePath = joinRemotePath(stagingDirectory(baseHome), descriptor.fileName);
    descriptor.sourceBasePath = parent.empty() ? baseHome : parent;
    descriptor.containedRelativeRoot = leaf;
    return descriptor;
}

std::expected<ArchiveDescriptor, TransferError> ArchivePacker::pack(RemoteSession& session,
                                                                    const std::string& baseHome,
                                                                    const std::string& path) const {
    auto planned = plan(baseHome, path);
    if (!planned) {
        return std::unexpected(planned.error());
    }
    return pack(session, *planned);
}

std::expected<ArchiveDescriptor, TransferError> ArchivePacker::pack(RemoteSession& session,
                                                                    const ArchiveDescriptor& planned) const {
    auto staging = ensureStagingDirectory(session, splitRemotePath(planned.remotePath).first);
    if (!staging) {
        return std::unexpected(staging.error());
    }

    ShellCommand tar("tar");
    tar.arg("czf").arg(planned.remotePath).arg("--exclude-backups").arg("--warning=no-file-changed")
        .arg("--").arg(planned.containedRelativeRoot);
    ShellCommand command("cd");
    command.arg(planned.sourceBasePath).then(tar);

    logger_.info("Creating archive " + planned.fileName + " of " + session.host() + ":" +
                 joinRemotePath(planned.sourceBasePath, planned.containedRelativeRoot));
    logger_.debug("[" + session.host() + "] " + command.redacted());

    auto result = session.execute(command.str(), options_.archiveTimeout);
    if (!result || !result->succeeded()) {
        std::string reason = result ? describeFailure(*result) : result.error();
        logger_.error("tar failed on " + session.host() + ": " + reason);

        ShellCommand list("ls");
        list.arg("-la").arg(planned.sourceBasePath);
        auto listing = session.execute(list.str(), options_.commandTimeout);
        if (listing && listing->succeeded()) {
            logger_.info("Contents of " + planned.sourceBasePath + ":\n" + listing->out);
        } else {
            logger_.error("Could not list " + planned.sourceBasePath + ": " +
                          (listing ? describeFailure(*listing) : listing.error()));
        }
        return std::unexpected(TransferError{TransferErrorKind::PackError,
                                             "Failed to create archive " + planned.fileName + " on " +
                                                 session.host() + ": " + reason});
    }

    return confirmArtifact(session, planned);
}

ArchiveDescriptor ArchivePacker::planFileList(const std::string& baseHome,
                                              const std::string& path,
                                              const std::string& label) const {
    std::string absolute = resolveRemotePath(baseHome, path);
    std::string stem = splitRemotePath(absolute).second + "_" + label;
    std::string stamp = currentTimestamp();
    std::string staging = stagingDirectory(baseHome);

    ArchiveDescriptor descriptor;
    descriptor.fileName = archiveName(stem, stamp);
    descriptor.remotePath = joinRemotePath(staging, descriptor.fileName);
    descriptor.sourceBasePath = absolute;
    descriptor.fileListPath = joinRemotePath(staging, sanitizeArchiveName(stem + "_" + stamp + ".list"));
    return descriptor;
}

std::expected<ArchiveDescriptor, TransferError> ArchivePacker::packFileList(RemoteSession& session,
                                                                            const ArchiveDescriptor& planned,
                                                                            const MissingFileSet& files) const {
    if (files.empty()) {
        return std::unexpected(TransferError{TransferErrorKind::PackError, "No files to archive"});
    }

    auto staging = ensureStagingDirectory(session, splitRemotePath(planned.remotePath).first);
    if (!staging) {
        return std::unexpected(staging.error());
    }

    auto writeList = [&](const ShellCommand& command) -> std::expected<void, TransferError> {
        auto result = session.execute(command.str(), options_.commandTimeout);
        if (!result || !result->succeeded()) {
            return std::unexpected(TransferError{TransferErrorKind::PackError,
                                                 "Failed to write file list " + planned.fileListPath + ": " +
                                                     (result ? describeFailure(*result) : result.error())});
        }
        return {};
    };

    ShellCommand truncate(":");
    truncate.raw(">").arg(planned.fileListPath);
    if (auto written = writeList(truncate); !written) {
        return std::unexpected(written.error());
    }

    std::vector<std::string> chunk;
    std::size_t chunkBytes = 0;
    auto flush = [&]() -> std::expected<void, TransferError> {
        if (chunk.empty()) {
            return {};
        }
        ShellCommand append("printf");
        append.arg("%s\\0").args(chunk).raw(">>").arg(planned.fileListPath);
        chunk.clear();
        chunkBytes = 0;
        return writeList(append);
    };

    for (const auto& file : files) {
        chunk.push_back(file);
        chunkBytes += file.size() + 3;
        if (chunk.size() >= kListChunkEntries || chunkBytes >= kListChunkBytes) {
            if (auto written = flush(); !written) {
                return std::unexpected(written.error());
            }
        }
    }
    if (auto written = flush(); !written) {
        return std::unexpected(written.error());
    }

    ShellCommand tar("tar");
    tar.arg("czf").arg(planned.remotePath).arg("--null").arg("-T").arg(planned.fileListPath);
    ShellCommand command("cd");
    command.arg(planned.sourceBasePath).then(tar);

    logger_.info("Creating archive " + planned.fileName + " with " + std::to_string(files.size()) + " listed files");
    logger_.debug("[" + session.host() + "] " + command.redacted());

    auto result = session.execute(command.str(), options_.archiveTimeout);
    if (!result || !result->succeeded()) {
        return std::unexpected(TransferError{TransferErrorKind::PackError,
                                             "Failed to create archive " + planned.fileName + " on " +
                                                 session.host() + ": " +
                                                 (result ? describeFailure(*result) : result.error())});
    }

    return confirmArtifact(session, planned);
}

std::expected<void, TransferError> ArchivePacker::ensureStagingDirectory(RemoteSession& session,
                                                                        const std::string& dir) const {
    ShellCommand mkdir("mkdir");
    mkdir.arg("-p").arg(dir);
    auto result = session.execute(mkdir.str(), options_.commandTimeout);
    if (!result || !result->succeeded()) {
        return std::unexpected(TransferError{TransferErrorKind::PackError,
                                             "Failed to create staging directory " + session.host() + ":" + dir +
                                                 ": " + (result ? describeFailure(*result) : result.error())});
    }
    return {};
}

std::expected<ArchiveDescriptor, TransferError> ArchivePacker::confirmArtifact(RemoteSession& session,
                                                                               const ArchiveDescriptor& planned) const {
    ShellCommand stat("stat");
    stat.arg("-c").arg("%s").arg(planned.remotePath);
    auto result = session.execute(stat.str(), options_.commandTimeout);
    if (!result || !result->succeeded()) {
        return std::unexpected(TransferError{TransferErrorKind::PackError,
                                             "Archive was not created: " + session.host() + ":" +
                                                 planned.remotePath});
    }

    ArchiveDescriptor descriptor = planned;
    descriptor.byteSize = DirectoryProber::parseCount(result->out);
    logger_.info("Archive created: " + planned.remotePath +
                 (descriptor.byteSize ? " (" + std::to_string(*descriptor.byteSize) + " bytes)" : std::string()));
    return descriptor;
}
