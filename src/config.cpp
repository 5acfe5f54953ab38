#include "config.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifndef SYSUP_SYSCONF_DIR
#define SYSUP_SYSCONF_DIR "/etc/sysup"
#endif

namespace fs = std::filesystem;

namespace {

std::string lowercase(std::string_view s) {
    std::string out;
    for (char c : s) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::optional<bool> parse_bool(std::string_view value) {
    const std::string v = lowercase(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

std::optional<long> parse_number(const std::string& value) {
    if (value.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long n = std::strtol(value.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return std::nullopt;
    return n;
}

std::set<std::string> to_set(const std::vector<std::string>& items) {
    return std::set<std::string>(items.begin(), items.end());
}

class ConfigParser {
public:
    ConfigParser(Config& config) : config_(config) {}

    void parse(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            ++line_no_;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string t = trim(line);
            if (t.empty() || t[0] == '#' || t[0] == ';') continue;

            if (t.front() == '[') {
                if (t.back() != ']' || t.size() < 3) {
                    problem("malformed section header '" + t + "'");
                    continue;
                }
                section_ = trim(std::string_view(t).substr(1, t.size() - 2));
                config_.manager_configs[section_].id = section_;
                continue;
            }

            const size_t pos = t.find('=');
            if (pos == std::string::npos) {
                problem("expected key=value, got '" + t + "'");
                continue;
            }
            std::string key = lowercase(trim(std::string_view(t).substr(0, pos)));
            std::string value = trim(std::string_view(t).substr(pos + 1));
            if (size_t c = value.find(" #"); c != std::string::npos) {
                value = trim(std::string_view(value).substr(0, c));
            }

            if (section_.empty()) {
                apply_global(key, value);
            } else {
                apply_manager(config_.manager_configs[section_], key, value);
            }
        }
    }

    bool managers_set() const { return managers_set_; }
    bool legacy_homebrew_only() const { return legacy_homebrew_only_; }

private:
    void problem(const std::string& what) {
        config_.parse_problems.push_back("line " + std::to_string(line_no_) + ": " + what);
    }

    void invalid(const std::string& key, const std::string& value) {
        problem("invalid value for " + key + ": '" + value + "'");
    }

    void set_flag(bool& target, const std::string& key, const std::string& value) {
        if (auto b = parse_bool(value)) target = *b;
        else invalid(key, value);
    }

    void set_seconds(std::chrono::seconds& target, const std::string& key, const std::string& value) {
        if (auto n = parse_number(value)) target = std::chrono::seconds(*n);
        else invalid(key, value);
    }

    void apply_global(const std::string& key, const std::string& value) {
        if (key == "log_level") {
            config_.log_level = lowercase(value);
        } else if (key == "log_file") {
            config_.log_file = value.empty() ? fs::path() : expand_user_path(value);
        } else if (key == "dry_run") {
            set_flag(config_.dry_run, key, value);
        } else if (key == "sudo_mode") {
            if (auto s = parse_sudo_strategy(lowercase(value))) {
                config_.sudo_strategy = *s;
                legacy_homebrew_only_ = lowercase(value) == "homebrew_only";
            } else {
                invalid(key, value);
            }
        } else if (key == "sudo_whitelist") {
            config_.sudo_whitelist = split_list(value);
        } else if (key == "timeout") {
            set_seconds(config_.timeout, key, value);
        } else if (key == "run_timeout") {
            set_seconds(config_.run_timeout, key, value);
        } else if (key == "parallelism") {
            auto n = parse_number(value);
            if (n && *n >= 0) config_.parallelism = static_cast<unsigned>(*n);
            else invalid(key, value);
        } else if (key == "exclude_packages") {
            for (auto& name : split_list(value)) config_.exclude_packages.insert(std::move(name));
        } else if (key == "managers") {
            config_.managers = split_list(value);
            managers_set_ = true;
        } else if (key == "extra_path") {
            config_.extra_path.clear();
            for (const auto& dir : split_list(value, ':')) config_.extra_path.push_back(expand_user_path(dir).string());
        } else if (key == "lock_file") {
            config_.lock_file = expand_user_path(value);
        } else {
            problem("unknown setting '" + key + "'");
        }
    }

    void apply_manager(ManagerConfig& mc, const std::string& key, const std::string& value) {
        if (key == "enabled") {
            set_flag(mc.enabled, key, value);
        } else if (key == "exclude_packages") {
            auto names = to_set(split_list(value));
            mc.exclude_packages.insert(names.begin(), names.end());
        } else if (key == "timeout") {
            std::chrono::seconds t{0};
            set_seconds(t, key, value);
            mc.timeout = t;
        } else if (key == "requires_sudo") {
            if (auto b = parse_bool(value)) mc.requires_sudo = *b;
            else invalid(key, value);
        } else if (key == "cleanup") {
            set_flag(mc.cleanup, key, value);
        } else if (key == "self_update") {
            set_flag(mc.self_update, key, value);
        } else {
            mc.options[key] = value;
        }
    }

    Config& config_;
    std::string section_;
    int line_no_ = 0;
    bool managers_set_ = false;
    bool legacy_homebrew_only_ = false;
};

const ManagerConfig& empty_manager_config() {
    static const ManagerConfig defaults;
    return defaults;
}

std::string bool_str(bool b) {
    return b ? "true" : "false";
}

} // anonymous namespace

std::optional<SudoStrategy> parse_sudo_strategy(std::string_view name) {
    if (name == "prompt") return SudoStrategy::Prompt;
    if (name == "whitelist" || name == "homebrew_only") return SudoStrategy::PasswordlessWhitelist;
    if (name == "passwordless" || name == "cache") return SudoStrategy::PasswordlessAll;
    if (name == "skip") return SudoStrategy::SkipPrivileged;
    return std::nullopt;
}

std::string_view sudo_strategy_name(SudoStrategy strategy) {
    switch (strategy) {
        case SudoStrategy::Prompt: return "prompt";
        case SudoStrategy::PasswordlessWhitelist: return "whitelist";
        case SudoStrategy::PasswordlessAll: return "passwordless";
        case SudoStrategy::SkipPrivileged: return "skip";
    }
    return "prompt";
}

std::string ManagerConfig::option(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

bool ManagerConfig::option_flag(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) return fallback;
    return parse_bool(it->second).value_or(fallback);
}

const ManagerConfig& Config::manager(const std::string& id) const {
    auto it = manager_configs.find(id);
    return it == manager_configs.end() ? empty_manager_config() : it->second;
}

bool Config::is_enabled(const std::string& id) const {
    if (std::find(managers.begin(), managers.end(), id) == managers.end()) return false;
    return manager(id).enabled;
}

Config parse_config(std::istream& in, const std::vector<std::string>& known_managers) {
    Config config;
    ConfigParser parser(config);
    parser.parse(in);

    if (!parser.managers_set()) {
        config.managers = known_managers;
    }
    if (parser.legacy_homebrew_only() && config.sudo_whitelist.empty()) {
        config.sudo_whitelist = {"brew"};
    }
    if (config.lock_file.empty()) {
        config.lock_file = default_state_dir() / "sysup.lock";
    }
    return config;
}

Config load_config(const std::optional<fs::path>& explicit_path, const std::vector<std::string>& known_managers) {
    std::optional<fs::path> path;
    if (explicit_path) {
        if (!fs::exists(*explicit_path)) {
            throw ConfigError(string_format("error.config_not_found", explicit_path->string()));
        }
        path = *explicit_path;
    } else {
        for (const auto& candidate : default_config_paths()) {
            if (fs::exists(candidate)) {
                path = candidate;
                break;
            }
        }
    }

    if (!path) {
        std::istringstream empty;
        return parse_config(empty, known_managers);
    }

    std::ifstream file(*path);
    if (!file.is_open()) {
        throw ConfigError(string_format("error.open_file_failed", path->string()));
    }
    Config config = parse_config(file, known_managers);
    config.source = *path;
    return config;
}

std::vector<fs::path> default_config_paths() {
    std::vector<fs::path> paths;
    const char* xdg = getenv("XDG_CONFIG_HOME");
    const char* home = getenv("HOME");
    if (xdg && *xdg) {
        paths.push_back(fs::path(xdg) / "sysup" / "sysup.conf");
    } else if (home) {
        paths.push_back(fs::path(home) / ".config" / "sysup" / "sysup.conf");
    }
    if (home) {
        paths.push_back(fs::path(home) / ".sysup.conf");
    }
    paths.push_back(fs::path(SYSUP_SYSCONF_DIR) / "sysup.conf");
    return paths;
}

fs::path default_state_dir() {
    if (const char* xdg = getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "sysup";
    }
    if (const char* home = getenv("HOME")) {
        return fs::path(home) / ".local" / "state" / "sysup";
    }
    return fs::path("/tmp") / ("sysup-" + std::to_string(getuid()));
}

std::vector<std::string> validate_config(const Config& config, const std::vector<std::string>& known_managers) {
    std::vector<std::string> problems = config.parse_problems;
    auto known = [&](const std::string& id) {
        return std::find(known_managers.begin(), known_managers.end(), id) != known_managers.end();
    };

    if (!parse_log_level(config.log_level)) {
        problems.push_back("invalid log_level: " + config.log_level);
    }
    if (config.timeout.count() <= 0) {
        problems.push_back("timeout must be positive");
    }
    if (config.run_timeout.count() < 0) {
        problems.push_back("run_timeout must not be negative");
    }
    if (config.parallelism == 0) {
        problems.push_back("parallelism must be at least 1");
    }
    if (config.sudo_strategy == SudoStrategy::PasswordlessWhitelist && config.sudo_whitelist.empty()) {
        problems.push_back("sudo_mode whitelist requires a non-empty sudo_whitelist");
    }

    std::set<std::string> seen;
    for (const auto& id : config.managers) {
        if (!known(id)) {
            problems.push_back("unknown manager: " + id);
        } else if (!seen.insert(id).second) {
            problems.push_back("manager listed twice: " + id);
        }
    }
    for (const auto& [id, mc] : config.manager_configs) {
        if (!known(id)) {
            problems.push_back("unknown manager section: [" + id + "]");
        }
        if (mc.timeout && mc.timeout->count() <= 0) {
            problems.push_back("timeout for " + id + " must be positive");
        }
    }
    return problems;
}

void write_default_config(const fs::path& path, const std::vector<std::string>& known_managers, bool force) {
    if (fs::exists(path) && !force) {
        throw ConfigError(string_format("error.config_exists", path.string()));
    }
    if (path.has_parent_path()) {
        ensure_dir_exists(path.parent_path());
    }

    fs::path tmp_path = path.string() + ".tmp";
    {
        std::ofstream file(tmp_path);
        if (!file.is_open()) {
            throw ConfigError(string_format("error.create_file_failed", tmp_path.string()));
        }
        file << "# sysup configuration\n"
             << "# Global settings\n"
             << "log_level=info\n"
             << "log_file=" << (default_state_dir() / "sysup.log").string() << "\n"
             << "dry_run=false\n"
             << "# prompt | whitelist | passwordless | skip\n"
             << "sudo_mode=prompt\n"
             << "# Command prefixes allowed without a password (sudo_mode=whitelist)\n"
             << "sudo_whitelist=brew\n"
             << "# Seconds per external command, and for the whole run (0 = unlimited)\n"
             << "timeout=600\n"
             << "run_timeout=0\n"
             << "parallelism=1\n"
             << "exclude_packages=\n"
             << "extra_path=/opt/homebrew/bin:/opt/homebrew/sbin:/usr/local/bin\n"
             << "# Enabled managers, in execution order\n"
             << "managers=" << join(known_managers, ", ") << "\n";

        for (const auto& id : known_managers) {
            file << "\n[" << id << "]\n"
                 << "enabled=true\n"
                 << "exclude_packages=\n";
            if (id == "homebrew") {
                file << "cleanup=true\n";
            } else if (id == "homebrew_cask") {
                // brew prompts on its own when an installer needs root.
                file << "requires_sudo=false\n"
                     << "greedy=false\n";
            } else if (id == "pip") {
                file << "user_only=true\n";
            } else if (id == "gem") {
                file << "user_install=true\n";
            } else if (id == "r_packages") {
                file << "cran_mirror=https://cran.rstudio.com\n";
            } else if (id == "texlive") {
                file << "requires_sudo=true\n";
            } else if (id == "vscode") {
                file << "cli=code\n";
            }
        }
    }
    fs::rename(tmp_path, path);
}

std::string dump_config(const Config& config) {
    std::ostringstream out;
    if (!config.source.empty()) out << "# loaded from " << config.source.string() << "\n";
    out << "log_level=" << config.log_level << "\n"
        << "log_file=" << config.log_file.string() << "\n"
        << "dry_run=" << bool_str(config.dry_run) << "\n"
        << "sudo_mode=" << sudo_strategy_name(config.sudo_strategy) << "\n"
        << "sudo_whitelist=" << join(config.sudo_whitelist, ", ") << "\n"
        << "timeout=" << config.timeout.count() << "\n"
        << "run_timeout=" << config.run_timeout.count() << "\n"
        << "parallelism=" << config.parallelism << "\n"
        << "exclude_packages=" << join({config.exclude_packages.begin(), config.exclude_packages.end()}, ", ") << "\n"
        << "extra_path=" << join(config.extra_path, ":") << "\n"
        << "lock_file=" << config.lock_file.string() << "\n"
        << "managers=" << join(config.managers, ", ") << "\n";

    for (const auto& [id, mc] : config.manager_configs) {
        out << "\n[" << id << "]\n"
            << "enabled=" << bool_str(mc.enabled) << "\n"
            << "exclude_packages=" << join({mc.exclude_packages.begin(), mc.exclude_packages.end()}, ", ") << "\n"
            << "cleanup=" << bool_str(mc.cleanup) << "\n"
            << "self_update=" << bool_str(mc.self_update) << "\n";
        if (mc.timeout) out << "timeout=" << mc.timeout->count() << "\n";
        if (mc.requires_sudo) out << "requires_sudo=" << bool_str(*mc.requires_sudo) << "\n";
        for (const auto& [key, value] : mc.options) out << key << "=" << value << "\n";
    }
    return out.str();
}
