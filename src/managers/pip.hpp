#pragma once

#include "manager.hpp"

#include <string_view>

// Parses `pip list --outdated --format=json`, an array of objects with
// "name", "version" and "latest_version".
PackageList parse_pip_outdated(std::string_view output);

class PipManager : public CommandManager {
public:
    explicit PipManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
    std::vector<std::string> self_update_command() const override;
    std::vector<std::string> version_command() const override;

private:
    std::vector<std::string> pip() const;
    bool user_only() const;
};
