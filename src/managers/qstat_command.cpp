#include "qstat_command.hpp"
#include <core/errors.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

QstatCommand::QstatCommand(QstatConfig config)
    : config_(std::move(config)) {}

std::string QstatCommand::describe() const {
    std::string cmd = config_.command;
    for (const auto& a : config_.args) cmd += " " + a;
    return cmd;
}

std::string QstatCommand::fetch() const {
    auto run = platform::run_capture(config_.command, config_.args);
    if (run.is_err()) {
        throw SubprocessError(run.error);
    }

    const auto& r = run.value;
    if (r.exit_code == platform::kExecFailedExitCode) {
        throw SubprocessError(fmt::format("{}: command not found", config_.command));
    }
    if (r.exit_code < 0) {
        throw SubprocessError(fmt::format("{} terminated abnormally", describe()));
    }
    if (r.failed()) {
        throw SubprocessError(fmt::format("{} exited with status {}", describe(), r.exit_code));
    }
    return r.stdout_data;
}
