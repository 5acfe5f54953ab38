#include "managers/pip.hpp"

#include "managers/json_output.hpp"

PackageList parse_pip_outdated(std::string_view output) {
    json doc = parse_json_output("pip list", output);

    PackageList packages;
    if (doc.is_null()) return packages;
    try {
        for (const auto& entry : doc.get_ref<const json::array_t&>()) {
            PackageInfo pkg;
            pkg.name = entry.at("name").get<std::string>();
            pkg.current_version = entry.at("version").get<std::string>();
            pkg.latest_version = entry.at("latest_version").get<std::string>();
            packages.push_back(std::move(pkg));
        }
    } catch (const json::exception& e) {
        throw unexpected_json("pip list", e);
    }
    return packages;
}

PipManager::PipManager(ManagerContext ctx)
    : CommandManager("pip", "pip", "python3", std::move(ctx)) {
    program_ = ctx_.config.option("python", program_);
    env_["PIP_DISABLE_PIP_VERSION_CHECK"] = "1";
}

std::vector<std::string> PipManager::pip() const {
    return {program_, "-m", "pip"};
}

bool PipManager::user_only() const {
    return ctx_.config.option_flag("user_only", true);
}

std::vector<std::string> PipManager::version_command() const {
    auto argv = pip();
    argv.push_back("--version");
    return argv;
}

PackageList PipManager::discover() {
    auto argv = pip();
    argv.insert(argv.end(), {"list", "--outdated"});
    if (user_only()) argv.push_back("--user");
    argv.push_back("--format=json");
    return parse_pip_outdated(run_query(argv).out);
}

std::vector<std::string> PipManager::upgrade_command(const PackageInfo& package) const {
    auto argv = pip();
    argv.push_back("install");
    if (user_only()) argv.push_back("--user");
    argv.insert(argv.end(), {"--upgrade", package.name});
    return argv;
}

std::vector<std::string> PipManager::self_update_command() const {
    PackageInfo pip_itself;
    pip_itself.name = "pip";
    return upgrade_command(pip_itself);
}
