#pragma once

#include "manager.hpp"

#include <string_view>

// Parses `mas outdated`: "<app id> <App Name> (<current> -> <latest>)".
// The numeric app id is the package name since `mas upgrade` takes ids.
PackageList parse_mas_outdated(std::string_view output);

class MasManager : public CommandManager {
public:
    explicit MasManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
    std::vector<std::string> version_command() const override { return {"mas", "version"}; }
};
