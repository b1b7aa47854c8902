/**
 * @file archive_packer.hpp
 * @brief Remote tar.gz archive creation for SiteRelay.
 *
 * Builds the transfer artifact on the source host with the host's own `tar`.
 * A directory is archived from its parent so the archive root is the leaf
 * directory name; recovery archives are built from an explicit member list.
 *
 * @note Requires GNU tar on the source host (`--exclude-backups`, `--null -T`).
 */

#ifndef ARCHIVE_PACKER_HPP
#define ARCHIVE_PACKER_HPP

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include "remote_session.hpp"
#include "transfer_logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief Settings of the archive packer.
 */
struct PackerOptions {
    std::string stagingDir = "tmp_trans"; ///< Staging directory, relative to the home directory unless absolute.
    std::chrono::seconds archiveTimeout{600}; ///< Timeout of the tar command.
    std::chrono::seconds commandTimeout{120}; ///< Timeout of the auxiliary commands (mkdir, stat, ls, printf).
    std::function<std::string()> timestamp; ///< Archive name timestamp; local "%Y%m%d_%H%M%S" when empty.
};

/**
 * @brief Creates compressed archives on a remote host.
 *
 * Work is split into a planning step, which only names the artifact, and a
 * packing step, which creates it. Callers register planned artifacts for
 * cleanup before packing so partially written archives are removed too.
 */
class ArchivePacker {
public:
    /**
     * @brief Constructs a packer.
     *
     * @param logger Run logger.
     * @param options Staging directory, timeouts and timestamp source.
     */
    ArchivePacker(const TransferLogger& logger, PackerOptions options);

    /**
     * @brief Names the archive of a directory without touching the host.
     *
     * @param baseHome Home directory of the source session.
     * @param path Directory to archive, relative to @p baseHome or absolute.
     * @return std::expected<ArchiveDescriptor, TransferError> The planned descriptor, or a PackError
     *         when the path has no leaf segment.
     */
    std::expected<ArchiveDescriptor, TransferError> plan(const std::string& baseHome, const std::string& path) const;

    /**
     * @brief Creates a planned directory archive.
     *
     * Ensures the staging directory exists, runs
     * `cd <parent> && tar czf <archive> --exclude-backups --warning=no-file-changed -- <leaf>`
     * and confirms the artifact with `stat`. On a tar failure the parent
     * directory listing is logged for diagnosis.
     *
     * @param session Source session.
     * @param planned Descriptor returned by plan().
     * @return std::expected<ArchiveDescriptor, TransferError> The descriptor with byteSize filled in, or a PackError.
     * @note tar exit status 1 ("some files differ") is fatal like any other non-zero status.
     */
    std::expected<ArchiveDescriptor, TransferError> pack(RemoteSession& session, const ArchiveDescriptor& planned) const;

    /**
     * @brief Plans and creates a directory archive in one call.
     */
    std::expected<ArchiveDescriptor, TransferError> pack(RemoteSession& session,
                                                         const std::string& baseHome,
                                                         const std::string& path) const;

    /**
     * @brief Names a file-list archive and its member list file.
     *
     * @param baseHome Home directory of the source session.
     * @param path Directory the listed paths are relative to.
     * @param label Tag embedded in the artifact names, e.g. "recovery".
     * @return ArchiveDescriptor The planned descriptor; fileListPath is set.
     */
    ArchiveDescriptor planFileList(const std::string& baseHome, const std::string& path, const std::string& label) const;

    /**
     * @brief Creates a planned file-list archive.
     *
     * Writes the member list as NUL-separated entries into the list file,
     * then runs `cd <path> && tar czf <archive> --null -T <list>`. Membership
     * comes from the list only.
     *
     * @param session Source session.
     * @param planned Descriptor returned by planFileList().
     * @param files Relative paths to include; must not be empty.
     * @return std::expected<ArchiveDescriptor, TransferError> The descriptor with byteSize filled in, or a PackError.
     */
    std::expected<ArchiveDescriptor, TransferError> packFileList(RemoteSession& session,
                                                                 const ArchiveDescriptor& planned,
                                                                 const MissingFileSet& files) const;

    /**
     * @brief Absolute staging directory for a home directory.
     */
    std::string stagingDirectory(const std::string& baseHome) const;

    /**
     * @brief Builds "<sanitized stem>_<timestamp>.tar.gz".
     */
    static std::string archiveName(const std::string& stem, const std::string& timestamp);

private:
    std::string currentTimestamp() const;

    std::expected<void, TransferError> ensureStagingDirectory(RemoteSession& session, const std::string& dir) const;

    std::expected<ArchiveDescriptor, TransferError> confirmArtifact(RemoteSession& session,
                                                                    const ArchiveDescriptor& planned) const;

    const TransferLogger& logger_; ///< Shared run logger.
    PackerOptions options_; ///< Staging directory, timeouts and timestamp source.
};

#endif // ARCHIVE_PACKER_HPP
