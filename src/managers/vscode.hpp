#pragma once

#include "manager.hpp"

#include <string_view>

// Parses `code --list-extensions --show-versions`: "<publisher>.<name>@<version>".
// The CLI cannot say which extensions have a newer release, so every
// installed extension is a candidate and its latest version stays unknown.
PackageList parse_code_extensions(std::string_view output);

class VSCodeManager : public CommandManager {
public:
    explicit VSCodeManager(ManagerContext ctx);

protected:
    PackageList discover() override;
    std::vector<std::string> upgrade_command(const PackageInfo& package) const override;
};
