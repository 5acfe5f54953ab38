#include "managers/gem.hpp"

#include "localization.hpp"

#include <regex>
#include <sstream>

PackageList parse_gem_outdated(std::string_view output) {
    static const std::regex line_re(R"(^(\S+) \(([^<)]+) < ([^)]+)\)$)");

    PackageList packages;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        std::smatch m;
        if (!std::regex_match(line, m, line_re)) {
            throw InvocationError(InvocationError::Kind::Failed,
                                  string_format("error.unparseable_output", "gem outdated", line));
        }
        PackageInfo pkg;
        pkg.name = m[1].str();
        pkg.current_version = trim(m[2].str());
        pkg.latest_version = trim(m[3].str());
        packages.push_back(std::move(pkg));
    }
    return packages;
}

GemManager::GemManager(ManagerContext ctx)
    : CommandManager("gem", "RubyGems", "gem", std::move(ctx)) {}

PackageList GemManager::discover() {
    return parse_gem_outdated(run_query({"gem", "outdated"}).out);
}

std::vector<std::string> GemManager::upgrade_command(const PackageInfo& package) const {
    std::vector<std::string> argv = {"gem", "update"};
    if (ctx_.config.option_flag("user_install", false)) argv.push_back("--user-install");
    argv.push_back(package.name);
    return argv;
}

std::vector<std::string> GemManager::cleanup_command() const {
    return {"gem", "cleanup"};
}

std::vector<std::string> GemManager::self_update_command() const {
    return {"gem", "update", "--system"};
}
