#pragma once

#include "manager.hpp"

#include <string_view>

// Parses `gem outdated`: "<name> (<current> < <latest>)".
PackageList parse_gem_outdated(std::string_view output);

class GemManager : public CommandManager {
public:
    explicit GemManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
    std::vector<std::string> cleanup_command() const override;
    std::vector<std::string> self_update_command() const override;
};
