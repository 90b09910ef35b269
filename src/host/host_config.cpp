/**
 * @file host_config.cpp
 * @brief Layered configuration load: defaults, config directory files, explicit file, environment.
 */
#include "host/host_config.hpp"
#include "utils/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace hostkeeper::host
{

namespace
{

const char *env_or_null(const char *name) noexcept
{
    const char *value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

/// Parses a JSON file. Missing file: null value. Unparseable file: runtime_error naming it.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return nlohmann::json{};
    try
    {
        nlohmann::json j;
        f >> j;
        if (!j.is_object())
        {
            throw std::runtime_error("top-level value is not an object");
        }
        return j;
    }
    catch (const std::exception &e)
    {
        throw std::runtime_error(fmt::format("config file '{}' is invalid: {}", path.string(), e.what()));
    }
}

} // namespace

const char *default_host_image_name() noexcept
{
#if defined(HOSTKEEPER_PLATFORM_WIN64)
    return "EXCEL.EXE";
#else
    return "excel";
#endif
}

void HostConfig::apply_json(const nlohmann::json &j)
{
    if (j.contains("session"))
    {
        const auto &s = j.at("session");
        if (s.contains("visible"))            visible            = s.at("visible").get<bool>();
        if (s.contains("display_alerts"))     display_alerts     = s.at("display_alerts").get<bool>();
        if (s.contains("attach_to_existing")) attach_to_existing = s.at("attach_to_existing").get<bool>();
    }
    if (j.contains("guardian"))
    {
        const auto &g = j.at("guardian");
        if (g.contains("host_image_name"))        host_image_name        = g.at("host_image_name").get<std::string>();
        if (g.contains("stop_release_passes"))    stop_release_passes    = g.at("stop_release_passes").get<size_t>();
        if (g.contains("cleanup_release_passes")) cleanup_release_passes = g.at("cleanup_release_passes").get<size_t>();
        if (g.contains("session_stop_wait_ms"))   session_stop_wait_ms   = g.at("session_stop_wait_ms").get<size_t>();
        if (g.contains("install_exit_hook"))      install_exit_hook      = g.at("install_exit_hook").get<bool>();
    }
    if (j.contains("logging"))
    {
        const auto &l = j.at("logging");
        if (l.contains("level") && l.at("level").is_string()) log_level = l.at("level").get<std::string>();
        if (l.contains("file") && l.at("file").is_string())   log_file  = l.at("file").get<std::string>();
    }
}

void HostConfig::apply_environment()
{
    if (const char *v = env_or_null("HOSTKEEPER_VISIBLE"))
        visible = format_tools::parse_bool(v, visible);
    if (const char *v = env_or_null("HOSTKEEPER_ATTACH"))
        attach_to_existing = format_tools::parse_bool(v, attach_to_existing);
    if (const char *v = env_or_null("HOSTKEEPER_HOST_IMAGE"))
        host_image_name = v;
    if (const char *v = env_or_null("HOSTKEEPER_LOG_FILE"))
        log_file = v;
    if (const char *v = env_or_null("HOSTKEEPER_LOG_LEVEL"))
        log_level = v;
}

nlohmann::json HostConfig::to_json() const
{
    return nlohmann::json{
        {"session",
         {{"visible", visible}, {"display_alerts", display_alerts}, {"attach_to_existing", attach_to_existing}}},
        {"guardian",
         {{"host_image_name", host_image_name},
          {"stop_release_passes", stop_release_passes},
          {"cleanup_release_passes", cleanup_release_passes},
          {"session_stop_wait_ms", session_stop_wait_ms},
          {"install_exit_hook", install_exit_hook}}},
        {"logging", {{"level", log_level}, {"file", log_file}}}};
}

SessionOptions HostConfig::session_options() const
{
    SessionOptions options;
    options.visible = visible;
    options.display_alerts = display_alerts;
    options.attach_to_existing = attach_to_existing;
    options.release_passes = stop_release_passes;
    return options;
}

HostConfig HostConfig::from_json(const nlohmann::json &j)
{
    HostConfig config;
    config.apply_json(j);
    return config;
}

fs::path HostConfig::discover_config_dir()
{
    if (const char *env = env_or_null("HOSTKEEPER_CONFIG_DIR"))
    {
        return fs::path(env);
    }

    const fs::path bin = fs::path(platform::get_executable_name(true)).parent_path();
    if (bin.empty())
        return {};

    std::error_code ec;
    // Staged layout: <root>/bin/ + <root>/config/
    fs::path candidate = bin / ".." / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);

    // Flat layout: config/ next to the binary
    candidate = bin / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);
    return {};
}

HostConfig HostConfig::load(const fs::path &override_path)
{
    HostConfig config;
    nlohmann::json merged = nlohmann::json::object();

    auto merge_file = [&](const fs::path &file, const char *what) {
        nlohmann::json j = read_json_file(file);
        if (j.is_null())
            return false;
        LOGGER_INFO("HostConfig: merging {} '{}'", what, file.string());
        json_merge(merged, j);
        config.loaded_files.push_back(file);
        return true;
    };

    config.config_dir = discover_config_dir();
    if (!config.config_dir.empty())
    {
        merge_file(config.config_dir / "hostkeeper.default.json", "defaults");
        merge_file(config.config_dir / "hostkeeper.user.json", "user overrides");
    }
    else
    {
        LOGGER_INFO("HostConfig: no config directory found; using built-in defaults");
    }

    fs::path explicit_file = override_path;
    if (explicit_file.empty())
    {
        if (const char *env = env_or_null("HOSTKEEPER_CONFIG_FILE"))
            explicit_file = env;
    }
    if (!explicit_file.empty() && !merge_file(explicit_file, "explicit file"))
    {
        throw std::runtime_error(fmt::format("config file '{}' cannot be read", explicit_file.string()));
    }

    try
    {
        config.apply_json(merged);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("config value has the wrong type: {}", e.what()));
    }
    config.apply_environment();

    LOGGER_INFO("HostConfig: visible={} display_alerts={} attach_to_existing={} host_image='{}' "
                "release_passes={}/{} stop_wait={}ms exit_hook={} log_level={} log_file='{}'",
                config.visible, config.display_alerts, config.attach_to_existing, config.host_image_name,
                config.stop_release_passes, config.cleanup_release_passes, config.session_stop_wait_ms,
                config.install_exit_hook,
                config.log_level, config.log_file);
    return config;
}

} // namespace hostkeeper::host
