#pragma once

#include "manager.hpp"

#include <string_view>

// Parses the output of the discovery script: tab separated
// "<package>\t<installed>\t<available>" rows between the "sysup-begin" and
// "sysup-end" markers. Missing markers mean R died before finishing.
PackageList parse_r_old_packages(std::string_view output);

class RPackagesManager : public CommandManager {
public:
    explicit RPackagesManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;

private:
    std::string mirror() const;
};
