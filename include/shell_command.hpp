/**
 * @file shell_command.hpp
 * @brief Structured construction of POSIX shell command lines.
 *
 * Every command SiteRelay sends to a remote host is assembled here instead of by
 * string interpolation, so paths with spaces, quotes or shell metacharacters
 * reach the remote utilities as single, literal arguments on any POSIX shell.
 */

#ifndef SHELL_COMMAND_HPP
#define SHELL_COMMAND_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @brief A shell command line built from a program, arguments and operators.
 *
 * Arguments are quoted when rendered; operators (pipes, `&&`, redirections) are
 * emitted verbatim. Secret arguments render normally in str() and as `****` in
 * redacted(), which is what gets logged.
 */
class ShellCommand {
public:
    /**
     * @brief Starts a command with the given program name.
     *
     * @param program Program to run (quoted like any argument).
     */
    explicit ShellCommand(std::string_view program);

    /**
     * @brief Appends a literal argument.
     */
    ShellCommand& arg(std::string_view value);

    /**
     * @brief Appends several literal arguments.
     */
    ShellCommand& args(const std::vector<std::string>& values);

    /**
     * @brief Appends an argument whose value must not appear in logs.
     */
    ShellCommand& secretArg(std::string_view value);

    /**
     * @brief Appends a trusted token verbatim (e.g. "2>/dev/null", ">>").
     *
     * @note Only for constants written in this code base, never for data.
     */
    ShellCommand& raw(std::string_view token);

    /**
     * @brief Pipes this command's stdout into another command.
     */
    ShellCommand& pipe(const ShellCommand& next);

    /**
     * @brief Runs another command only if this one succeeded (`&&`).
     */
    ShellCommand& then(const ShellCommand& next);

    /**
     * @brief Renders the command text sent to the remote shell.
     */
    std::string str() const;

    /**
     * @brief Renders the command text with secret arguments masked.
     */
    std::string redacted() const;

    /**
     * @brief Quotes one word for a POSIX shell.
     *
     * Words made only of `[A-Za-z0-9_@%+=:,./-]` are returned unchanged; everything
     * else is wrapped in single quotes, with embedded quotes written as `'"'"'`.
     *
     * @param value Word to quote.
     * @return std::string Shell-safe rendition of the word.
     */
    static std::string quote(std::string_view value);

private:
    enum class TokenKind { Argument, Secret, Raw };

    std::string render(bool maskSecrets) const;

    std::vector<std::pair<TokenKind, std::string>> tokens_; ///< Tokens in order.
};

/**
 * @brief Replaces every character outside `[A-Za-z0-9._-]` with '_'.
 *
 * @param name Proposed artifact file name.
 * @return std::string Name safe to embed in paths and FTP URLs on both hosts.
 */
std::string sanitizeArchiveName(std::string_view name);

/**
 * @brief Joins a remote directory and a relative name with a single '/'.
 */
std::string joinRemotePath(std::string_view base, std::string_view name);

/**
 * @brief Splits a remote path into its parent directory and its last segment.
 *
 * Trailing slashes are ignored. A single-segment relative path has an empty
 * parent; a single-segment absolute path has "/" as parent.
 *
 * @param path Remote path such as "mail/example.com/info".
 * @return std::pair<std::string, std::string> (parent, leaf).
 */
std::pair<std::string, std::string> splitRemotePath(std::string_view path);

/**
 * @brief Resolves a path against a home directory unless it is already absolute.
 */
std::string resolveRemotePath(std::string_view home, std::string_view path);

#endif // SHELL_COMMAND_HPP
