#include <iostream>
#include <string>
#include <vector>
#include "cli/ansi_screen.hpp"
#include "cli/dashboard.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "managers/qstat_command.hpp"
#include "managers/queue_poller.hpp"
#include "platform/terminal.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("qwatch", "Watch the PBS queue");
    std::cout << theme::usage("qwatch --once", "Print the queue once and exit");
    std::cout << theme::usage("qwatch --config <path>", "Use another config file");
    std::cout << theme::usage("qwatch --write-config", "Create ~/.qwatch/config.yaml");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Keys: (a)uto refresh  (u)ser's jobs  (r)efresh  (q)uit\n\n"
              << "    qwatch --version        Show version\n"
              << "    qwatch --help           Show this help"
              << theme::color::RESET << "\n\n";
}

static int run_once(const Config& config) {
    QstatCommand qstat(config.qstat());
    QueuePoller poller([&qstat] { return qstat.fetch(); }, config.refresh_interval());

    auto event = poller.poll_once();
    if (!event.ok) {
        std::cerr << theme::fail(event.error);
        return 1;
    }

    auto jobs = poller.snapshot()->jobs;
    if (config.view().only_mine) {
        jobs = filter_by_owner(jobs, config.filter_user());
    }
    std::cout << render_job_table(jobs);
    return 0;
}

static int run_dashboard(const Config& config) {
    if (!platform::is_interactive()) {
        std::cerr << theme::fail("qwatch needs a terminal; use --once for plain output");
        return 1;
    }

    QstatCommand qstat(config.qstat());
    DashboardOptions opts;
    opts.interval = config.refresh_interval();
    opts.auto_refresh = config.view().auto_refresh;
    opts.only_mine = config.view().only_mine;
    opts.user = config.filter_user();

    qwatch_logf("qwatch {}: command '{}', user {}, config {}", QWATCH_VERSION,
                qstat.describe(), opts.user,
                config.source().empty() ? "(defaults)" : config.source().string());

    AnsiScreen screen;
    Dashboard dashboard(screen, [&qstat] { return qstat.fetch(); }, opts);
    return dashboard.run();
}

int main(int argc, char** argv) {
    try {
        fs::path config_path = get_config_path();
        bool once = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "qwatch"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << QWATCH_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--once") {
                once = true;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("Missing path after --config.");
                    std::cout << theme::step("Usage: qwatch --config <path>");
                    return 1;
                }
                config_path = argv[++i];
            } else if (arg == "--write-config") {
                auto written = create_default_config(config_path);
                if (written.is_err()) {
                    std::cout << theme::fail(written.error);
                    return 1;
                }
                std::cout << theme::step("Config at " + config_path.string());
                return 0;
            } else {
                std::cout << theme::fail("Unknown argument: " + arg);
                print_usage();
                return 1;
            }
        }

        auto config = Config::load(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }

        return once ? run_once(config.value) : run_dashboard(config.value);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
