#include "managers/factory.hpp"

#include "localization.hpp"
#include "managers/gem.hpp"
#include "managers/homebrew.hpp"
#include "managers/mas.hpp"
#include "managers/npm.hpp"
#include "managers/pip.hpp"
#include "managers/r_packages.hpp"
#include "managers/texlive.hpp"
#include "managers/vscode.hpp"

const std::vector<std::string>& known_manager_ids() {
    static const std::vector<std::string> ids = {
        "homebrew", "homebrew_cask", "mas", "npm", "pip", "gem", "r_packages", "texlive", "vscode",
    };
    return ids;
}

ManagerPtr create_manager(const std::string& id, ManagerContext ctx) {
    if (id == "homebrew") return std::make_unique<HomebrewManager>(std::move(ctx));
    if (id == "homebrew_cask") return std::make_unique<HomebrewCaskManager>(std::move(ctx));
    if (id == "mas") return std::make_unique<MasManager>(std::move(ctx));
    if (id == "npm") return std::make_unique<NpmManager>(std::move(ctx));
    if (id == "pip") return std::make_unique<PipManager>(std::move(ctx));
    if (id == "gem") return std::make_unique<GemManager>(std::move(ctx));
    if (id == "r_packages") return std::make_unique<RPackagesManager>(std::move(ctx));
    if (id == "texlive") return std::make_unique<TexLiveManager>(std::move(ctx));
    if (id == "vscode") return std::make_unique<VSCodeManager>(std::move(ctx));
    throw NotFoundError(string_format("error.unknown_manager", id));
}
