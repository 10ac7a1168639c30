#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Runs the queue status command and returns its stdout.
class QstatCommand {
public:
    explicit QstatCommand(QstatConfig config);

    // Blocks until the command exits. Throws SubprocessError when it cannot
    // be started, exits non-zero, or dies on a signal.
    std::string fetch() const;

    std::string describe() const;

private:
    QstatConfig config_;
};
