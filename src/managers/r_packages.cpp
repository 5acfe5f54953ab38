#include "managers/r_packages.hpp"

#include "localization.hpp"

#include <regex>
#include <sstream>

namespace {

constexpr std::string_view BEGIN_MARKER = "sysup-begin";
constexpr std::string_view END_MARKER = "sysup-end";

InvocationError unparseable(const std::string& line) {
    return InvocationError(InvocationError::Kind::Failed,
                           string_format("error.unparseable_output", "Rscript", line));
}

} // anonymous namespace

PackageList parse_r_old_packages(std::string_view output) {
    // R package names: letters, digits and dots. Anything else would end up
    // inside an R expression on upgrade.
    static const std::regex name_re(R"(^[A-Za-z][A-Za-z0-9.]*$)");

    PackageList packages;
    std::istringstream in{std::string(output)};
    std::string line;
    bool begun = false;
    bool ended = false;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (!begun) {
            begun = t == BEGIN_MARKER;
            continue;
        }
        if (t == END_MARKER) {
            ended = true;
            break;
        }
        if (t.empty()) continue;

        auto fields = split_list(t, '\t');
        if (fields.size() != 3 || !std::regex_match(fields[0], name_re)) {
            throw unparseable(t);
        }
        PackageInfo pkg;
        pkg.name = fields[0];
        pkg.current_version = fields[1];
        pkg.latest_version = fields[2];
        packages.push_back(std::move(pkg));
    }
    if (!begun || !ended) {
        throw unparseable(begun ? std::string(END_MARKER) + " missing" : std::string(BEGIN_MARKER) + " missing");
    }
    return packages;
}

RPackagesManager::RPackagesManager(ManagerContext ctx)
    : CommandManager("r_packages", "R packages", "Rscript", std::move(ctx)) {}

std::string RPackagesManager::mirror() const {
    return ctx_.config.option("cran_mirror", "https://cran.rstudio.com");
}

PackageList RPackagesManager::discover() {
    const std::string script =
        "options(warn = 2); "
        "o <- old.packages(repos = \"" + mirror() + "\"); "
        "cat(\"sysup-begin\\n\"); "
        "if (!is.null(o)) for (i in seq_len(nrow(o))) "
        "cat(o[i, \"Package\"], \"\\t\", o[i, \"Installed\"], \"\\t\", o[i, \"ReposVer\"], \"\\n\", sep = \"\"); "
        "cat(\"sysup-end\\n\")";
    return parse_r_old_packages(run_query({"Rscript", "--vanilla", "-e", script}).out);
}

std::vector<std::string> RPackagesManager::upgrade_command(const PackageInfo& package) const {
    // warn = 2 turns install.packages' "installation had non-zero exit
    // status" warning into an error, and so into a non-zero exit code.
    return {"Rscript", "--vanilla", "-e",
            "options(warn = 2); install.packages(\"" + package.name + "\", repos = \"" + mirror() + "\")"};
}
