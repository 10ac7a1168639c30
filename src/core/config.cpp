#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

// Builds a Config from a parsed YAML document; the only writer of Config's
// private fields.
class ConfigBuilder {
public:
    static Result<Config> from_yaml(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("top level must be a mapping");
        }

        if (root["qstat"]) {
            const auto& q = root["qstat"];
            if (!q.IsMap()) {
                return Result<Config>::Err("'qstat' must be a mapping");
            }
            config.qstat_.command = q["command"].as<std::string>(QSTAT_PROGRAM);
            if (q["args"]) {
                // Accept a single string or a list
                if (q["args"].IsSequence()) {
                    config.qstat_.args = q["args"].as<std::vector<std::string>>();
                } else if (q["args"].IsScalar()) {
                    config.qstat_.args = {q["args"].as<std::string>()};
                } else {
                    config.qstat_.args.clear();
                }
            }
        }
        if (config.qstat_.command.empty()) {
            return Result<Config>::Err("'qstat.command' must not be empty");
        }

        int interval = root["refresh_interval_ms"].as<int>(REFRESH_INTERVAL_MS);
        if (interval <= 0) {
            return Result<Config>::Err("'refresh_interval_ms' must be positive");
        }
        config.refresh_interval_ = std::chrono::milliseconds(interval);

        config.view_.auto_refresh = root["auto_refresh"].as<bool>(true);
        config.view_.only_mine = root["only_mine"].as<bool>(false);
        config.view_.user = root["user"].as<std::string>("");

        return Result<Config>::Ok(config);
    }

    static void set_source(Config& config, const fs::path& path) {
        config.source_ = path;
    }
};

Config::Config()
    : qstat_{QSTAT_PROGRAM, {QSTAT_XML_FLAG}},
      refresh_interval_(REFRESH_INTERVAL_MS) {}

std::string Config::filter_user() const {
    return view_.user.empty() ? current_username() : view_.user;
}

fs::path get_config_dir() {
    return platform::home_dir() / ".qwatch";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder::from_yaml(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config());
    }

    try {
        auto result = ConfigBuilder::from_yaml(YAML::LoadFile(path.string()));
        if (result.is_err()) {
            return Result<Config>::Err(path.string() + ": " + result.error);
        }
        ConfigBuilder::set_source(result.value, path);
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse ") + path.string() + ": " + e.what());
    }
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# qwatch configuration

qstat:
  command: "qstat"        # queue status executable
  args: ["-x"]            # must produce XML output

# Auto-refresh cadence, measured from the end of the previous poll
refresh_interval_ms: 2000

# Initial state of the two toggles
auto_refresh: true        # (a)
only_mine: false          # (u)

# User for "only my jobs"; empty means the login user
user: ""
)";

    try {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
