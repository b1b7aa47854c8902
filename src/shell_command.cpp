#include "shell_command.hpp"
#include <cctype>

namespace {

bool isSafeShellChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

std::string_view trimTrailingSlashes(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    return path;
}

} // namespace

ShellCommand::ShellCommand(std::string_view program) {
    arg(program);
}

ShellCommand& ShellCommand::arg(std::string_view value) {
    tokens_.emplace_back(TokenKind::Argument, std::string(value));
    return *this;
}

ShellCommand& ShellCommand::args(const std::vector<std::string>& values) {
    for (const auto& value : values) {
        arg(value);
    }
    return *this;
}

ShellCommand& ShellCommand::secretArg(std::string_view value) {
    tokens_.emplace_back(TokenKind::Secret, std::string(value));
    return *this;
}

ShellCommand& ShellCommand::raw(std::string_view token) {
    tokens_.emplace_back(TokenKind::Raw, std::string(token));
    return *this;
}

ShellCommand& ShellCommand::pipe(const ShellCommand& next) {
    raw("|");
    tokens_.insert(tokens_.end(), next.tokens_.begin(), next.tokens_.end());
    return *this;
}

ShellCommand& ShellCommand::then(const ShellCommand& next) {
    raw("&&");
    tokens_.insert(tokens_.end(), next.tokens_.begin(), next.tokens_.end());
    return *this;
}

std::string ShellCommand::str() const {
    return render(false);
}

std::string ShellCommand::redacted() const {
    return render(true);
}

std::string ShellCommand::render(bool maskSecrets) const {
    std::string out;
    for (const auto& [kind, text] : tokens_) {
        if (!out.empty()) {
            out += ' ';
        }
        switch (kind) {
            case TokenKind::Raw:
                out += text;
                break;
            case TokenKind::Secret:
                out += maskSecrets ? std::string("****") : quote(text);
                break;
            case TokenKind::Argument:
                out += quote(text);
                break;
        }
    }
    return out;
}

std::string ShellCommand::quote(std::string_view value) {
    if (value.empty()) {
        return "''";
    }
    bool safe = true;
    for (char c : value) {
        if (!isSafeShellChar(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return std::string(value);
    }

    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string sanitizeArchiveName(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        out += keep ? c : '_';
    }
    return out;
}

std::string joinRemotePath(std::string_view base, std::string_view name) {
    while (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }
    base = trimTrailingSlashes(base);
    if (base.empty()) {
        return std::string(name);
    }
    if (name.empty()) {
        return std::string(base);
    }
    if (base == "/") {
        return "/" + std::string(name);
    }
    return std::string(base) + "/" + std::string(name);
}

std::pair<std::string, std::string> splitRemotePath(std::string_view path) {
    path = trimTrailingSlashes(path);
    auto pos = path.rfind('/');
    if (pos == std::string_view::npos) {
        return {std::string(), std::string(path)};
    }
    if (pos == 0) {
        return {"/", std::string(path.substr(1))};
    }
    return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}

std::string resolveRemotePath(std::string_view home, std::string_view path) {
    path = trimTrailingSlashes(path);
    if (!path.empty() && path.front() == '/') {
        return std::string(path);
    }
    return joinRemotePath(home, path);
}
