#include "fake_remote_session.hpp"
#include <utility>

namespace {

class FakeExecution : public RemoteExecution {
public:
    FakeExecution(std::vector<OutputChunk> chunks, int exitCode, bool hangs)
        : chunks_(std::move(chunks)), exitCode_(exitCode), hangs_(hangs) {}

    std::expected<OutputChunk, std::string> readAvailable() override {
        if (next_ < chunks_.size()) {
            return chunks_[next_++];
        }
        return OutputChunk{};
    }

    bool exitStatusReady() override { return !hangs_ && next_ >= chunks_.size(); }

    std::expected<int, std::string> finish() override { return exitCode_; }

private:
    std::vector<OutputChunk> chunks_;
    std::size_t next_ = 0;
    int exitCode_;
    bool hangs_;
};

} // namespace

FakeRemoteSession::FakeRemoteSession(std::string host) : host_(std::move(host)) {}

FakeRemoteSession::Rule& FakeRemoteSession::ruleFor(const std::string& needle) {
    for (auto& rule : rules_) {
        if (rule.needle == needle) {
            rule.responses.clear();
            return rule;
        }
    }
    rules_.push_back(Rule{needle, {}});
    return rules_.back();
}

FakeRemoteSession& FakeRemoteSession::on(const std::string& needle, const std::string& out, int exitCode,
                                         const std::string& err) {
    CommandResult result;
    result.exitCode = exitCode;
    result.out = out;
    result.err = err;
    ruleFor(needle).responses.emplace_back(std::move(result));
    return *this;
}

FakeRemoteSession& FakeRemoteSession::onSequence(const std::string& needle, const std::vector<std::string>& outputs) {
    Rule& rule = ruleFor(needle);
    for (const auto& out : outputs) {
        CommandResult result;
        result.exitCode = 0;
        result.out = out;
        rule.responses.emplace_back(std::move(result));
    }
    return *this;
}

FakeRemoteSession& FakeRemoteSession::onError(const std::string& needle, const std::string& error) {
    ruleFor(needle).responses.emplace_back(std::unexpected(error));
    return *this;
}

FakeRemoteSession& FakeRemoteSession::onStream(const std::string& needle, std::vector<OutputChunk> chunks,
                                               int exitCode) {
    streamRules_.push_back(StreamRule{needle, std::move(chunks), exitCode, false});
    return *this;
}

FakeRemoteSession& FakeRemoteSession::onHangingStream(const std::string& needle) {
    streamRules_.push_back(StreamRule{needle, {}, 0, true});
    return *this;
}

std::expected<CommandResult, std::string> FakeRemoteSession::execute(const std::string& command,
                                                                     std::chrono::seconds /*timeout*/) {
    commands_.push_back(command);
    if (!connected_) {
        return std::unexpected(std::string("session closed"));
    }

    Rule* best = nullptr;
    for (auto& rule : rules_) {
        if (command.find(rule.needle) != std::string::npos && !rule.responses.empty() &&
            (!best || rule.needle.size() > best->needle.size())) {
            best = &rule;
        }
    }
    if (!best) {
        CommandResult ok;
        ok.exitCode = 0;
        return ok;
    }

    auto response = best->responses.front();
    if (best->responses.size() > 1) {
        best->responses.pop_front();
    }
    return response;
}

std::expected<std::unique_ptr<RemoteExecution>, std::string> FakeRemoteSession::executeStreaming(
    const std::string& command) {
    commands_.push_back(command);
    if (!connected_) {
        return std::unexpected(std::string("session closed"));
    }

    const StreamRule* best = nullptr;
    for (const auto& rule : streamRules_) {
        if (command.find(rule.needle) != std::string::npos && (!best || rule.needle.size() >= best->needle.size())) {
            best = &rule;
        }
    }
    if (!best) {
        return std::make_unique<FakeExecution>(std::vector<OutputChunk>{}, 0, false);
    }
    return std::make_unique<FakeExecution>(best->chunks, best->exitCode, best->hangs);
}

void FakeRemoteSession::close() {
    connected_ = false;
    ++closeCount_;
}

int FakeRemoteSession::count(const std::string& needle) const {
    int n = 0;
    for (const auto& command : commands_) {
        if (command.find(needle) != std::string::npos) {
            ++n;
        }
    }
    return n;
}

SessionConnector fakeConnector(std::map<std::string, std::shared_ptr<FakeRemoteSession>> sessions) {
    return [sessions = std::move(sessions)](const HostConfig& host)
               -> std::expected<std::unique_ptr<RemoteSession>, std::string> {
        auto it = sessions.find(host.host);
        if (it == sessions.end()) {
            return std::unexpected(std::string("Connection refused"));
        }
        return std::make_unique<SharedSessionHandle>(it->second);
    };
}

std::string nulList(const std::vector<std::string>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        out += entry;
        out += '\0';
    }
    return out;
}
