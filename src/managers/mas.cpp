#include "managers/mas.hpp"

#include "localization.hpp"

#include <regex>
#include <sstream>

PackageList parse_mas_outdated(std::string_view output) {
    static const std::regex line_re(R"(^(\d+)\s+(.*?)\s*(?:\((\S+)\s+->\s+(\S+)\))?$)");

    PackageList packages;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        std::smatch m;
        if (!std::regex_match(line, m, line_re)) {
            throw InvocationError(InvocationError::Kind::Failed,
                                  string_format("error.unparseable_output", "mas outdated", line));
        }
        PackageInfo pkg;
        pkg.name = m[1].str();
        pkg.current_version = m[3].str();
        pkg.latest_version = m[4].str();
        packages.push_back(std::move(pkg));
    }
    return packages;
}

MasManager::MasManager(ManagerContext ctx)
    : CommandManager("mas", "Mac App Store", "mas", std::move(ctx)) {}

PackageList MasManager::discover() {
    return parse_mas_outdated(run_query({"mas", "outdated"}).out);
}

std::vector<std::string> MasManager::upgrade_command(const PackageInfo& package) const {
    return {"mas", "upgrade", package.name};
}
