#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".warden";
}

fs::path get_default_config_path() {
    return get_config_dir() / "config.yaml";
}

Config::Config()
    : state_dir_(get_config_dir() / "state"),
      log_file_(get_config_dir() / "warden.log"),
      confirm_ttl_(DEFAULT_CONFIRM_TTL_SECS) {
    guardian_.cpu_threshold = DEFAULT_CPU_THRESHOLD;
    guardian_.ram_threshold = DEFAULT_RAM_THRESHOLD;
    guardian_.host_check_interval = DEFAULT_HOST_CHECK_SECS;
    guardian_.instance_check_interval = DEFAULT_INSTANCE_CHECK_SECS;
    tool_.command_timeout = DEFAULT_COMMAND_TIMEOUT_SECS;
    ports_.first = DEFAULT_PORT_FIRST;
    ports_.last = DEFAULT_PORT_LAST;
}

Result<void> Config::apply_yaml(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) return Result<void>::Ok();
        if (!root.IsMap()) {
            return Result<void>::Err(ErrorKind::Validation, "config root must be a mapping");
        }

        guardian_.cpu_threshold = root["cpu_threshold"].as<int>(guardian_.cpu_threshold);
        guardian_.ram_threshold = root["ram_threshold"].as<int>(guardian_.ram_threshold);
        guardian_.host_check_interval =
            root["host_check_interval"].as<int>(guardian_.host_check_interval);
        guardian_.instance_check_interval =
            root["check_interval"].as<int>(guardian_.instance_check_interval);
        guardian_.host_guardian_enabled =
            root["host_guardian"].as<bool>(guardian_.host_guardian_enabled);

        tool_.tool = root["tool"].as<std::string>(tool_.tool);
        tool_.image = root["image"].as<std::string>(tool_.image);
        tool_.storage_pool = root["storage_pool"].as<std::string>(tool_.storage_pool);
        tool_.instance_prefix = root["instance_prefix"].as<std::string>(tool_.instance_prefix);
        tool_.command_timeout = root["command_timeout"].as<int>(tool_.command_timeout);

        main_admin_ = root["main_admin"].as<std::string>(main_admin_);
        confirm_ttl_ = root["confirm_ttl"].as<int>(confirm_ttl_);

        if (root["state_dir"]) state_dir_ = root["state_dir"].as<std::string>();
        if (root["log_file"]) log_file_ = root["log_file"].as<std::string>();

        if (root["ports"] && root["ports"].IsMap()) {
            ports_.first = root["ports"]["first"].as<int>(ports_.first);
            ports_.last = root["ports"]["last"].as<int>(ports_.last);
        }
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(ErrorKind::Validation,
                                 std::string("Failed to parse config: ") + e.what());
    }
    return Result<void>::Ok();
}

Result<void> Config::apply_env() {
    auto env_int = [](const char* name, int& target) -> Result<void> {
        const char* raw = std::getenv(name);
        if (!raw) return Result<void>::Ok();
        auto v = parse_int(raw);
        if (!v) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("{} must be an integer (got '{}')", name, raw));
        }
        target = *v;
        return Result<void>::Ok();
    };
    auto env_str = [](const char* name, std::string& target) {
        const char* raw = std::getenv(name);
        if (raw && *raw) target = raw;
    };

    for (auto r : {env_int("CPU_THRESHOLD", guardian_.cpu_threshold),
                   env_int("RAM_THRESHOLD", guardian_.ram_threshold),
                   env_int("HOST_CHECK_INTERVAL", guardian_.host_check_interval),
                   env_int("CHECK_INTERVAL", guardian_.instance_check_interval)}) {
        if (r.is_err()) return r;
    }

    env_str("DEFAULT_STORAGE_POOL", tool_.storage_pool);
    env_str("WARDEN_TOOL", tool_.tool);
    env_str("WARDEN_IMAGE", tool_.image);
    env_str("MAIN_ADMIN_ID", main_admin_);

    std::string dir;
    env_str("WARDEN_STATE_DIR", dir);
    if (!dir.empty()) state_dir_ = dir;

    std::string log;
    env_str("WARDEN_LOG", log);
    if (!log.empty()) log_file_ = log;

    return Result<void>::Ok();
}

Result<void> Config::validate() const {
    auto bad = [](const std::string& msg) {
        return Result<void>::Err(ErrorKind::Validation, msg);
    };

    if (guardian_.cpu_threshold < 1 || guardian_.cpu_threshold > 100)
        return bad(fmt::format("cpu_threshold must be within 1..100 (got {})", guardian_.cpu_threshold));
    if (guardian_.ram_threshold < 1 || guardian_.ram_threshold > 100)
        return bad(fmt::format("ram_threshold must be within 1..100 (got {})", guardian_.ram_threshold));
    if (guardian_.host_check_interval <= 0)
        return bad("host_check_interval must be positive");
    if (guardian_.instance_check_interval <= 0)
        return bad("check_interval must be positive");
    if (tool_.command_timeout <= 0)
        return bad("command_timeout must be positive");
    if (confirm_ttl_ <= 0)
        return bad("confirm_ttl must be positive");
    if (ports_.first < 1 || ports_.last > 65535 || ports_.first > ports_.last)
        return bad(fmt::format("port range {}-{} is invalid", ports_.first, ports_.last));
    if (tool_.tool.empty())
        return bad("tool must not be empty");
    if (tool_.instance_prefix.empty())
        return bad("instance_prefix must not be empty");

    return Result<void>::Ok();
}

Result<Config> Config::load(const std::optional<fs::path>& config_file) {
    Config config;

    fs::path path = config_file.value_or(get_default_config_path());
    bool explicit_file = config_file.has_value();

    if (fs::exists(path)) {
        std::ifstream in(path);
        if (!in) {
            return Result<Config>::Err(ErrorKind::Validation,
                                       "Cannot read config file " + path.string());
        }
        std::stringstream buf;
        buf << in.rdbuf();
        auto r = config.apply_yaml(buf.str());
        if (r.is_err()) return Result<Config>::Fail(r);
    } else if (explicit_file) {
        return Result<Config>::Err(ErrorKind::NotFound,
                                   "Config file not found at " + path.string());
    }

    auto env = config.apply_env();
    if (env.is_err()) return Result<Config>::Fail(env);

    auto valid = config.validate();
    if (valid.is_err()) return Result<Config>::Fail(valid);

    return Result<Config>::Ok(config);
}
