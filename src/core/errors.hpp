#pragma once

#include <stdexcept>
#include <string>

// Base for every failure qwatch raises itself.
class QwatchError : public std::runtime_error {
public:
    explicit QwatchError(const std::string& msg) : std::runtime_error(msg) {}
};

// Status command missing, unreadable, or exited abnormally.
class SubprocessError : public QwatchError {
public:
    explicit SubprocessError(const std::string& msg) : QwatchError(msg) {}
};

// qstat output is not a well-formed document.
class ParseError : public QwatchError {
public:
    explicit ParseError(const std::string& msg) : QwatchError(msg) {}
};

// A single field value could not be interpreted (e.g. non-numeric memory).
class FormatError : public QwatchError {
public:
    explicit FormatError(const std::string& msg) : QwatchError(msg) {}
};

// Requested field path is absent from a job record.
class LookupError : public QwatchError {
public:
    explicit LookupError(const std::string& msg) : QwatchError(msg) {}
};
