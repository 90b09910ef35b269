#pragma once
/**
 * @file host_config.hpp
 * @brief Resolved hostkeeper configuration and its layered loader.
 *
 * Layers, lowest priority first:
 *  1. built-in defaults (the member initializers below);
 *  2. `hostkeeper.default.json`, then `hostkeeper.user.json`, from the config directory
 *     (`HOSTKEEPER_CONFIG_DIR`, else `<binary dir>/../config`, else `<binary dir>/config`);
 *  3. one explicit file: the argument of load(), else `HOSTKEEPER_CONFIG_FILE`;
 *  4. `HOSTKEEPER_VISIBLE`, `HOSTKEEPER_ATTACH`, `HOSTKEEPER_HOST_IMAGE`, `HOSTKEEPER_LOG_FILE`
 *     and `HOSTKEEPER_LOG_LEVEL` from the environment.
 *
 * File layout:
 * @code
 *  {
 *    "session":  { "visible": false, "display_alerts": false, "attach_to_existing": true },
 *    "guardian": { "host_image_name": "EXCEL.EXE", "stop_release_passes": 3,
 *                  "cleanup_release_passes": 5, "session_stop_wait_ms": 2000,
 *                  "install_exit_hook": true },
 *    "logging":  { "level": "info", "file": "" }
 *  }
 * @endcode
 */

#include "host/host_session.hpp"
#include "hostkeeper_host_export.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

/// @brief Host executable name the guardian looks for on this platform.
HOSTKEEPER_HOST_EXPORT const char *default_host_image_name() noexcept;

struct HOSTKEEPER_HOST_EXPORT HostConfig
{
    bool visible = false;
    bool display_alerts = false;
    bool attach_to_existing = true;

    std::string host_image_name = default_host_image_name();
    size_t stop_release_passes = 3;
    size_t cleanup_release_passes = 5;
    size_t session_stop_wait_ms = 2000; ///< How long shutdown waits for a busy session.
    bool install_exit_hook = true;

    std::string log_level = "info";
    std::string log_file; ///< Empty: log to the console.

    std::filesystem::path config_dir;                 ///< Directory the files came from, if any.
    std::vector<std::filesystem::path> loaded_files;  ///< In the order they were applied.

    /**
     * @brief Applies the keys present in @p j; absent keys keep their value.
     * @throws nlohmann::json::exception when a present key has the wrong type.
     */
    void apply_json(const nlohmann::json &j);

    /// @brief Reads the HOSTKEEPER_* override variables.
    void apply_environment();

    [[nodiscard]] nlohmann::json to_json() const;
    [[nodiscard]] SessionOptions session_options() const;

    /// @brief Defaults overlaid with @p j.
    static HostConfig from_json(const nlohmann::json &j);

    /**
     * @brief Runs the full layered load.
     * @param override_path Explicit file for layer 3; must exist when given.
     * @throws std::runtime_error naming the file when a file cannot be parsed or has a bad value.
     */
    static HostConfig load(const std::filesystem::path &override_path = {});

    /// @brief Locates the config directory for layer 2; empty if none exists.
    static std::filesystem::path discover_config_dir();
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
