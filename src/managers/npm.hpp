#pragma once

#include "manager.hpp"

#include <string_view>

// Parses `npm outdated -g --json`: an object keyed by package name holding
// "current", "wanted" and "latest". An "error" object means npm failed.
PackageList parse_npm_outdated(std::string_view output);

class NpmManager : public CommandManager {
public:
    explicit NpmManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
    std::vector<std::string> self_update_command() const override;
};
