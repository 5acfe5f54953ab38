#include "managers/vscode.hpp"

#include "localization.hpp"

#include <regex>
#include <sstream>

PackageList parse_code_extensions(std::string_view output) {
    static const std::regex line_re(R"(^([A-Za-z0-9][A-Za-z0-9-]*\.[A-Za-z0-9][A-Za-z0-9._-]*)@(\S+)$)");

    PackageList packages;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        std::smatch m;
        if (!std::regex_match(line, m, line_re)) {
            throw InvocationError(InvocationError::Kind::Failed,
                                  string_format("error.unparseable_output", "code --list-extensions", line));
        }
        PackageInfo pkg;
        pkg.name = m[1].str();
        pkg.current_version = m[2].str();
        packages.push_back(std::move(pkg));
    }
    return packages;
}

VSCodeManager::VSCodeManager(ManagerContext ctx)
    : CommandManager("vscode", "VS Code extensions", "code", std::move(ctx)) {
    // code-insiders and codium take the same arguments.
    program_ = ctx_.config.option("cli", program_);
}

PackageList VSCodeManager::discover() {
    return parse_code_extensions(run_query({program_, "--list-extensions", "--show-versions"}).out);
}

std::vector<std::string> VSCodeManager::upgrade_command(const PackageInfo& package) const {
    return {program_, "--install-extension", package.name, "--force"};
}
