#pragma once

#include <string>
#include <vector>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Local command execution result (stderr is discarded by the runner)
struct CommandResult {
    int exit_code;
    std::string stdout_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Configuration structures
struct QstatConfig {
    std::string command;
    std::vector<std::string> args;
};

struct ViewDefaults {
    bool auto_refresh = true;
    bool only_mine = false;
    std::string user;                  // empty = login user
};
