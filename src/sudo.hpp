#pragma once

#include "config.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

class Executor;

enum class SudoOutcome {
    Proceed,
    Skip,
    Abort
};

struct SudoDecision {
    SudoOutcome outcome = SudoOutcome::Skip;
    std::string reason;
};

// A privileged step as the negotiator sees it: which manager asks, and the
// command (without any sudo prefix) it wants to run.
struct PrivilegedOperation {
    std::string manager;
    std::vector<std::string> command;
};

// Non-interactive check of the credential cache. An empty command asks
// "may I run anything", a command asks about that specific command.
class CredentialProbe {
public:
    virtual ~CredentialProbe() = default;
    virtual bool credentials_cached(const std::vector<std::string>& command) = 0;
};

// Probes with `sudo -n true` or `sudo -n -l <command>`; never prompts.
class SudoProbe : public CredentialProbe {
public:
    explicit SudoProbe(Executor& executor) : executor_(executor) {}
    bool credentials_cached(const std::vector<std::string>& command) override;

private:
    Executor& executor_;
};

inline constexpr const char* REASON_PRIVILEGE_DISABLED = "privileged execution disabled by policy";
inline constexpr const char* REASON_NO_SESSION = "no interactive session and no cached credentials";
inline constexpr const char* REASON_NO_CREDENTIALS = "no cached credentials";
inline constexpr const char* REASON_NOT_WHITELISTED = "command not in passwordless whitelist";
inline constexpr const char* REASON_WHITELIST_NO_CREDENTIALS = "no cached credentials for whitelisted command";

class SudoNegotiator {
public:
    enum class State {
        Unknown,
        Available,
        Unavailable
    };

    using Resolver = std::function<bool(const std::string&)>;

    SudoNegotiator(SudoStrategy strategy, std::vector<std::string> whitelist, CredentialProbe& probe,
                   Resolver resolver, bool interactive);

    SudoNegotiator(const SudoNegotiator&) = delete;
    SudoNegotiator& operator=(const SudoNegotiator&) = delete;

    // Decides one privileged operation. Credentials are probed afresh for
    // every decision since the sudo timestamp can expire mid-run. Safe to
    // call from several managers at once; probes are serialized.
    SudoDecision decide(const PrivilegedOperation& op);

    State state() const;
    SudoStrategy strategy() const { return strategy_; }
    size_t probe_count() const;

private:
    bool probe(const std::vector<std::string>& command);
    const std::vector<std::string>* match_whitelist(const std::vector<std::string>& command) const;

    SudoStrategy strategy_;
    std::vector<std::vector<std::string>> whitelist_;
    CredentialProbe& probe_;
    Resolver resolver_;
    bool interactive_;

    mutable std::mutex mutex_;
    State state_ = State::Unknown;
    size_t probe_count_ = 0;
};

// Tokenized whitelist prefix matching: the program is compared by file name
// (so "/opt/homebrew/bin/brew" matches "brew"), remaining tokens exactly.
bool command_has_prefix(const std::vector<std::string>& command, const std::vector<std::string>& prefix);
