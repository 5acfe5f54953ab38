#pragma once

#include "manager.hpp"

#include <string_view>

// Which array of `brew outdated --json=v2` to read.
enum class BrewSection {
    Formulae,
    Casks
};

// Parses `brew outdated --json=v2`. Pinned formulae are left out, brew
// refuses to upgrade them anyway.
PackageList parse_brew_outdated(std::string_view output, BrewSection section);

class HomebrewManager : public CommandManager {
public:
    explicit HomebrewManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
    std::vector<std::string> cleanup_command() const override;
    std::vector<std::string> self_update_command() const override;
    // brew refuses to run as root.
    bool maintenance_privileged() const override { return false; }
};

class HomebrewCaskManager : public CommandManager {
public:
    explicit HomebrewCaskManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
    // brew asks for a password itself when an installer needs root, so casks
    // are tried unprivileged unless requires_sudo says otherwise.
    bool escalates_itself() const override { return true; }
};
