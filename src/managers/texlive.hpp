#pragma once

#include "manager.hpp"

#include <string_view>

// Parses `tlmgr update --list --machine-readable`. Package rows sit between
// "end-of-header" and "end-of-updates"; only rows with status "u" (update
// available) are candidates.
PackageList parse_tlmgr_updates(std::string_view output);

class TexLiveManager : public CommandManager {
public:
    explicit TexLiveManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
    std::vector<std::string> self_update_command() const override;
    std::vector<std::string> version_command() const override { return {"tlmgr", "version"}; }
    bool privileged_by_default() const override { return true; }
};
