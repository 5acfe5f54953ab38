#include "sudo.hpp"

#include "executor.hpp"
#include "utils.hpp"

#include <utility>

bool SudoProbe::credentials_cached(const std::vector<std::string>& command) {
    std::vector<std::string> argv = {"sudo", "-n"};
    if (command.empty()) {
        argv.push_back("true");
    } else {
        argv.push_back("-l");
        argv.insert(argv.end(), command.begin(), command.end());
    }
    ExecOptions options;
    options.timeout = std::chrono::seconds(10);
    ProcessOutput output = executor_.run(argv, options);
    return !output.timed_out && !output.cancelled && output.exit_code == 0;
}

bool command_has_prefix(const std::vector<std::string>& command, const std::vector<std::string>& prefix) {
    if (prefix.empty() || command.size() < prefix.size()) return false;
    if (fs::path(command[0]).filename() != fs::path(prefix[0]).filename()) return false;
    for (size_t i = 1; i < prefix.size(); ++i) {
        if (command[i] != prefix[i]) return false;
    }
    return true;
}

SudoNegotiator::SudoNegotiator(SudoStrategy strategy, std::vector<std::string> whitelist, CredentialProbe& probe,
                               Resolver resolver, bool interactive)
    : strategy_(strategy), probe_(probe), resolver_(std::move(resolver)), interactive_(interactive) {
    for (const auto& entry : whitelist) {
        auto tokens = split_whitespace(entry);
        if (!tokens.empty()) whitelist_.push_back(std::move(tokens));
    }
}

SudoDecision SudoNegotiator::decide(const PrivilegedOperation& op) {
    switch (strategy_) {
        case SudoStrategy::SkipPrivileged:
            return {SudoOutcome::Skip, REASON_PRIVILEGE_DISABLED};

        case SudoStrategy::PasswordlessWhitelist: {
            const auto* entry = match_whitelist(op.command);
            if (!entry) {
                return {SudoOutcome::Skip, REASON_NOT_WHITELISTED};
            }
            if (resolver_ && !resolver_(entry->front())) {
                return {SudoOutcome::Abort, "whitelisted command '" + join(*entry) + "' cannot be resolved"};
            }
            if (probe(op.command)) {
                return {SudoOutcome::Proceed, "whitelisted command with cached credentials"};
            }
            return {SudoOutcome::Skip, REASON_WHITELIST_NO_CREDENTIALS};
        }

        case SudoStrategy::PasswordlessAll:
            if (probe({})) {
                return {SudoOutcome::Proceed, "cached credentials"};
            }
            return {SudoOutcome::Skip, REASON_NO_CREDENTIALS};

        case SudoStrategy::Prompt:
            if (probe({})) {
                return {SudoOutcome::Proceed, "cached credentials"};
            }
            if (interactive_) {
                return {SudoOutcome::Proceed, "interactive session, sudo may prompt"};
            }
            return {SudoOutcome::Skip, REASON_NO_SESSION};
    }
    return {SudoOutcome::Skip, REASON_PRIVILEGE_DISABLED};
}

SudoNegotiator::State SudoNegotiator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t SudoNegotiator::probe_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_count_;
}

bool SudoNegotiator::probe(const std::vector<std::string>& command) {
    // Held across the probe itself so two managers never race a credential
    // cache that is about to expire.
    std::lock_guard<std::mutex> lock(mutex_);
    const bool available = probe_.credentials_cached(command);
    ++probe_count_;
    state_ = available ? State::Available : State::Unavailable;
    return available;
}

const std::vector<std::string>* SudoNegotiator::match_whitelist(const std::vector<std::string>& command) const {
    for (const auto& entry : whitelist_) {
        if (command_has_prefix(command, entry)) return &entry;
    }
    return nullptr;
}
