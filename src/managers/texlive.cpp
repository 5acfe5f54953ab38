#include "managers/texlive.hpp"

#include "localization.hpp"

#include <sstream>

namespace {

InvocationError unparseable(const std::string& line) {
    return InvocationError(InvocationError::Kind::Failed,
                           string_format("error.unparseable_output", "tlmgr update --list", line));
}

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream in(line);
    std::string field;
    while (std::getline(in, field, '\t')) fields.push_back(field);
    return fields;
}

} // anonymous namespace

PackageList parse_tlmgr_updates(std::string_view output) {
    PackageList packages;
    std::istringstream in{std::string(output)};
    std::string line;
    bool in_updates = false;
    bool header_seen = false;
    bool ended = false;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!in_updates) {
            if (line == "end-of-header") {
                in_updates = true;
                header_seen = true;
            }
            continue;
        }
        if (line == "end-of-updates") {
            ended = true;
            break;
        }
        if (trim(line).empty()) continue;

        // name, status, localrev, serverrev, size, runtime, esttot, tag,
        // lcat-version, rcat-version, description
        auto fields = split_tabs(line);
        if (fields.size() < 4 || fields[0].empty() || fields[1].size() != 1) {
            throw unparseable(line);
        }
        if (fields[1] != "u") continue;

        PackageInfo pkg;
        pkg.name = fields[0];
        pkg.current_version = fields.size() > 8 && !fields[8].empty() && fields[8] != "-" ? fields[8] : fields[2];
        pkg.latest_version = fields.size() > 9 && !fields[9].empty() && fields[9] != "-" ? fields[9] : fields[3];
        packages.push_back(std::move(pkg));
    }
    if (!header_seen || !ended) {
        throw unparseable(header_seen ? "end-of-updates missing" : "end-of-header missing");
    }
    return packages;
}

TexLiveManager::TexLiveManager(ManagerContext ctx)
    : CommandManager("texlive", "TeX Live", "tlmgr", std::move(ctx)) {}

PackageList TexLiveManager::discover() {
    return parse_tlmgr_updates(run_query({"tlmgr", "update", "--list", "--machine-readable"}).out);
}

std::vector<std::string> TexLiveManager::upgrade_command(const PackageInfo& package) const {
    return {"tlmgr", "update", package.name};
}

std::vector<std::string> TexLiveManager::self_update_command() const {
    return {"tlmgr", "update", "--self"};
}
