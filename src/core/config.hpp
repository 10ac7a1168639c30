#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Defaults: `qstat -x` every 2 s, auto refresh on, filter off.
    Config();

    // Load from a YAML file. A missing file yields the defaults.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const QstatConfig& qstat() const { return qstat_; }
    const ViewDefaults& view() const { return view_; }
    std::chrono::milliseconds refresh_interval() const { return refresh_interval_; }
    const fs::path& source() const { return source_; }

    // User the "only my jobs" filter compares against.
    std::string filter_user() const;

private:
    QstatConfig qstat_;
    ViewDefaults view_;
    std::chrono::milliseconds refresh_interval_;
    fs::path source_;            // empty when running on defaults

    friend class ConfigBuilder;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Write the commented default config if none exists at path.
Result<void> create_default_config(const fs::path& path = get_config_path());
