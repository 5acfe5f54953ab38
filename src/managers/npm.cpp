#include "managers/npm.hpp"

#include "localization.hpp"
#include "managers/json_output.hpp"

PackageList parse_npm_outdated(std::string_view output) {
    json doc = parse_json_output("npm outdated", output);

    PackageList packages;
    if (doc.is_null()) return packages;
    try {
        // A package may itself be called "error"; npm's own report has no "latest".
        if (doc.contains("error") && !doc.at("error").contains("latest")) {
            const json& error = doc.at("error");
            std::string summary = error.is_object() ? error.value("summary", error.dump()) : error.dump();
            throw InvocationError(InvocationError::Kind::Failed,
                                  string_format("error.unparseable_output", "npm outdated", summary));
        }
        for (const auto& [name, entry] : doc.get_ref<const json::object_t&>()) {
            PackageInfo pkg;
            pkg.name = name;
            // Missing when the package is listed but not installed.
            pkg.current_version = entry.value("current", "");
            pkg.latest_version = entry.at("latest").get<std::string>();
            if (pkg.latest_version.empty()) {
                throw InvocationError(InvocationError::Kind::Failed,
                                      string_format("error.unparseable_output", "npm outdated", name));
            }
            packages.push_back(std::move(pkg));
        }
    } catch (const json::exception& e) {
        throw unexpected_json("npm outdated", e);
    }
    return packages;
}

NpmManager::NpmManager(ManagerContext ctx)
    : CommandManager("npm", "npm (global)", "npm", std::move(ctx)) {}

PackageList NpmManager::discover() {
    // Exit status 1 means "something is outdated", unless nothing was printed.
    ProcessOutput output = run_query({"npm", "outdated", "-g", "--json"}, {0, 1});
    if (output.exit_code == 1 && trim(output.out).empty()) {
        throw InvocationError(InvocationError::Kind::Failed,
                              string_format("error.invocation_failed", "npm outdated", output.exit_code),
                              output.exit_code, output.err);
    }
    return parse_npm_outdated(output.out);
}

std::vector<std::string> NpmManager::upgrade_command(const PackageInfo& package) const {
    return {"npm", "install", "-g", package.name + "@latest"};
}

std::vector<std::string> NpmManager::self_update_command() const {
    return {"npm", "install", "-g", "npm@latest"};
}
