#include "managers/homebrew.hpp"

#include "managers/json_output.hpp"

namespace {

void set_brew_env(std::map<std::string, std::string>& env) {
    env["HOMEBREW_NO_ENV_HINTS"] = "1";
    env["HOMEBREW_NO_AUTO_UPDATE"] = "1";
}

} // anonymous namespace

PackageList parse_brew_outdated(std::string_view output, BrewSection section) {
    const char* key = section == BrewSection::Formulae ? "formulae" : "casks";
    json doc = parse_json_output("brew outdated", output);

    PackageList packages;
    if (doc.is_null()) return packages;
    try {
        for (const auto& entry : doc.at(key)) {
            if (entry.value("pinned", false)) continue;

            PackageInfo pkg;
            pkg.name = entry.at("name").get<std::string>();
            // Several installed versions are listed oldest first; older casks
            // report a single string.
            const json& installed = entry.at("installed_versions");
            if (installed.is_string()) {
                pkg.current_version = installed.get<std::string>();
            } else if (!installed.empty()) {
                pkg.current_version = installed.back().get<std::string>();
            }
            pkg.latest_version = entry.at("current_version").get<std::string>();
            packages.push_back(std::move(pkg));
        }
    } catch (const json::exception& e) {
        throw unexpected_json("brew outdated", e);
    }
    return packages;
}

HomebrewManager::HomebrewManager(ManagerContext ctx)
    : CommandManager("homebrew", "Homebrew", "brew", std::move(ctx)) {
    set_brew_env(env_);
}

PackageList HomebrewManager::discover() {
    return parse_brew_outdated(run_query({"brew", "outdated", "--formula", "--json=v2"}).out,
                               BrewSection::Formulae);
}

std::vector<std::string> HomebrewManager::upgrade_command(const PackageInfo& package) const {
    return {"brew", "upgrade", "--formula", package.name};
}

std::vector<std::string> HomebrewManager::cleanup_command() const {
    return {"brew", "cleanup"};
}

std::vector<std::string> HomebrewManager::self_update_command() const {
    return {"brew", "update"};
}

HomebrewCaskManager::HomebrewCaskManager(ManagerContext ctx)
    : CommandManager("homebrew_cask", "Homebrew Casks", "brew", std::move(ctx)) {
    set_brew_env(env_);
}

PackageList HomebrewCaskManager::discover() {
    std::vector<std::string> argv = {"brew", "outdated", "--cask", "--json=v2"};
    if (ctx_.config.option_flag("greedy", false)) argv.push_back("--greedy");
    return parse_brew_outdated(run_query(argv).out, BrewSection::Casks);
}

std::vector<std::string> HomebrewCaskManager::upgrade_command(const PackageInfo& package) const {
    return {"brew", "upgrade", "--cask", package.name};
}
