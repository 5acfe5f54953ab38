#include "config.hpp"
#include "exception.hpp"
#include "executor.hpp"
#include "localization.hpp"
#include "managers/factory.hpp"
#include "orchestrator.hpp"
#include "registry.hpp"
#include "report.hpp"
#include "sudo.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <signal.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifndef SYSUP_L10N_DIR
#define SYSUP_L10N_DIR "/usr/share/sysup/l10n"
#endif

namespace {

CancelToken g_cancel;

void handle_signal(int) {
    g_cancel.cancel();
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.update_desc") << std::endl;
    std::cerr << get_string("info.status_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.config_desc") << std::endl;
}

int print_listing(Orchestrator& orchestrator) {
    for (const auto& listing : orchestrator.list_managers()) {
        std::cout << string_format("info.list_row", listing.id, listing.display_name,
                                   listing.available ? get_string("info.available") : get_string("info.not_installed"),
                                   listing.enabled ? get_string("info.enabled") : get_string("info.disabled"))
                  << std::endl;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Logger logger;
    try {
        init_localization(SYSUP_L10N_DIR);

        cxxopts::Options options(argv[0], string_format("info.usage", argv[0]));

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("c,config", get_string("info.config_option_desc"), cxxopts::value<std::string>())
            ("n,dry-run", get_string("info.dry_run_desc"), cxxopts::value<bool>()->default_value("false"))
            ("v,verbose", get_string("info.verbose_desc"), cxxopts::value<bool>()->default_value("false"))
            ("j,parallel", get_string("info.parallel_desc"), cxxopts::value<unsigned>())
            ("sudo-mode", get_string("info.sudo_mode_desc"), cxxopts::value<std::string>())
            ("non-interactive", get_string("info.non_interactive_desc"), cxxopts::value<bool>()->default_value("false"))
            ("init", get_string("info.init_desc"), cxxopts::value<bool>()->default_value("false"))
            ("validate", get_string("info.validate_desc"), cxxopts::value<bool>()->default_value("false"))
            ("force", get_string("info.force_desc"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("managers", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "managers"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }
        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        const std::vector<std::string> selected = result.count("managers")
            ? result["managers"].as<std::vector<std::string>>()
            : std::vector<std::string>{};
        const bool verbose = result["verbose"].as<bool>();

        std::optional<fs::path> config_path;
        if (result.count("config")) {
            config_path = expand_user_path(result["config"].as<std::string>());
        }
        const auto& known = known_manager_ids();

        if (command == "config" && result["init"].as<bool>()) {
            fs::path target = config_path ? *config_path : default_config_paths().front();
            write_default_config(target, known, result["force"].as<bool>());
            logger.info(string_format("info.config_written", target.string()));
            return 0;
        }

        Config config = load_config(config_path, known);
        if (result["dry-run"].as<bool>()) {
            config.dry_run = true;
        }
        if (result.count("parallel")) {
            config.parallelism = result["parallel"].as<unsigned>();
        }
        if (result.count("sudo-mode")) {
            const std::string mode = result["sudo-mode"].as<std::string>();
            auto strategy = parse_sudo_strategy(mode);
            if (!strategy) {
                throw ConfigError(string_format("error.invalid_sudo_mode", mode));
            }
            config.sudo_strategy = *strategy;
        }

        const auto problems = validate_config(config, known);
        if (command == "config") {
            if (result["validate"].as<bool>()) {
                for (const auto& problem : problems) {
                    logger.error(string_format("error.config_problem", problem));
                }
                if (problems.empty()) {
                    logger.info(get_string("info.config_valid"));
                }
                return problems.empty() ? 0 : 1;
            }
            for (const auto& problem : problems) {
                logger.warning(string_format("error.config_problem", problem));
            }
            std::cout << dump_config(config);
            return 0;
        }
        if (!problems.empty()) {
            for (const auto& problem : problems) {
                logger.error(string_format("error.config_problem", problem));
            }
            throw ConfigError(get_string("error.config_invalid"));
        }

        logger.set_level(*parse_log_level(config.log_level));
        if (!config.log_file.empty()) {
            logger.open_file(config.log_file);
        }
        if (config.source.empty()) {
            logger.debug(get_string("debug.config_defaults"));
        } else {
            logger.debug(string_format("debug.config_loaded", config.source.string()));
        }

        const bool interactive = !result["non-interactive"].as<bool>() && is_interactive_session();

        PosixSpawner spawner;
        Executor executor(spawner, logger, config.timeout);
        executor.set_extra_path(config.extra_path);
        executor.set_cancel_token(&g_cancel);

        ManagerRegistry registry = build_registry(config, executor, logger, interactive);
        SudoProbe probe(executor);
        SudoNegotiator negotiator(config.sudo_strategy, config.sudo_whitelist, probe,
                                  [&executor](const std::string& program) { return executor.resolve(program); },
                                  interactive);
        Orchestrator orchestrator(config, registry, negotiator, logger, g_cancel);

        if (command == "list") {
            return print_listing(orchestrator);
        }
        if (command != "status" && command != "update") {
            print_usage(options);
            return 1;
        }

        install_signal_handlers();
        if (config.run_timeout.count() > 0) {
            g_cancel.set_deadline(std::chrono::steady_clock::now() + config.run_timeout);
        }

        std::unique_ptr<RunLock> run_lock;
        RunReport report(RunMode::Status, false);
        if (command == "status") {
            // Status never mutates; let the executor enforce it.
            executor.set_dry_run(true);
            report = orchestrator.run_status(selected);
        } else {
            run_lock = std::make_unique<RunLock>(config.lock_file);
            executor.set_dry_run(config.dry_run);
            if (config.dry_run) {
                logger.info(get_string("info.dry_run_notice"));
            }
            report = orchestrator.run_update(selected, config.dry_run);
        }

        std::cout << render_report(report, verbose);
        const Status overall = report.overall_status();
        if (overall == Status::Cancelled) {
            logger.warning(get_string("warning.run_cancelled"));
        }
        logger.info(string_format("info.run_finished", status_name(overall)));
        return exit_code_for(overall);

    } catch (const cxxopts::exceptions::exception& e) {
        logger.error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const SysupException& e) {
        logger.error(string_format("error.sysup_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        logger.error(string_format("error.unexpected_error", e.what()));
        return 1;
    }
}
