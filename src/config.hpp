#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

enum class SudoStrategy {
    Prompt,
    PasswordlessWhitelist,
    PasswordlessAll,
    SkipPrivileged
};

std::optional<SudoStrategy> parse_sudo_strategy(std::string_view name);
std::string_view sudo_strategy_name(SudoStrategy strategy);

// Settings of one [manager] section.
struct ManagerConfig {
    std::string id;
    bool enabled = true;
    std::set<std::string> exclude_packages;
    std::optional<std::chrono::seconds> timeout;
    std::optional<bool> requires_sudo;
    bool cleanup = true;
    bool self_update = true;
    // Manager specific keys (greedy, user_only, cran_mirror, ...)
    std::map<std::string, std::string> options;

    std::string option(const std::string& key, const std::string& fallback = "") const;
    bool option_flag(const std::string& key, bool fallback) const;
};

// Fully resolved configuration of one run. Passed by reference to whoever
// needs it; there is no global instance.
struct Config {
    std::string log_level = "info";
    std::filesystem::path log_file;
    bool dry_run = false;
    SudoStrategy sudo_strategy = SudoStrategy::Prompt;
    std::vector<std::string> sudo_whitelist;
    std::chrono::seconds timeout{600};
    std::chrono::seconds run_timeout{0};
    unsigned parallelism = 1;
    std::set<std::string> exclude_packages;
    // Enabled managers in execution order. Empty until parsed, then
    // defaulted to every known manager.
    std::vector<std::string> managers;
    std::vector<std::string> extra_path;
    std::filesystem::path lock_file;
    std::map<std::string, ManagerConfig> manager_configs;

    // Where the configuration came from; empty when built from defaults.
    std::filesystem::path source;
    // Problems found while parsing (bad values); reported by validate_config.
    std::vector<std::string> parse_problems;

    // Section for `id`, or defaults when the file has none.
    const ManagerConfig& manager(const std::string& id) const;
    bool is_enabled(const std::string& id) const;
};

// Parses "key=value" lines with "[section]" headers. Unknown keys in a
// manager section become manager options; unknown global keys and malformed
// values are recorded in parse_problems.
Config parse_config(std::istream& in, const std::vector<std::string>& known_managers);

// --config path if given, otherwise the first existing default location,
// otherwise defaults. An explicit path that does not exist is a ConfigError.
Config load_config(const std::optional<std::filesystem::path>& explicit_path,
                   const std::vector<std::string>& known_managers);

std::vector<std::filesystem::path> default_config_paths();
std::filesystem::path default_state_dir();

// Returns every problem found; an empty list means the configuration is usable.
std::vector<std::string> validate_config(const Config& config, const std::vector<std::string>& known_managers);

// Writes a commented default configuration. Refuses to overwrite unless force.
void write_default_config(const std::filesystem::path& path, const std::vector<std::string>& known_managers, bool force);

// Human readable effective configuration, in the same syntax parse_config reads.
std::string dump_config(const Config& config);
