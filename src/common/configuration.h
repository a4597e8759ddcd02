#ifndef CLIPBRIDGE_COMMON_CONFIGURATION_H_
#define CLIPBRIDGE_COMMON_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>

#include "common/config.h"

namespace YAML {
class Node;
}

namespace ClipBridge {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ClipBridgeConfig {
    // How the worker executable is located and launched
    struct Worker {
        ConfigValue<std::string> python_path{DEFAULT_PYTHON_PATH, "CLIPBRIDGE_PYTHON_PATH"};
        ConfigValue<std::string> server_script{DEFAULT_SERVER_SCRIPT, "CLIPBRIDGE_SERVER_SCRIPT"};
        ConfigValue<std::string> client_script{DEFAULT_CLIENT_SCRIPT, "CLIPBRIDGE_CLIENT_SCRIPT"};
        // When set, clipbridge-server/clipbridge-client in this directory replace the interpreter
        ConfigValue<std::string> standalone_dir{"", "CLIPBRIDGE_STANDALONE_DIR"};
        ConfigValue<std::string> working_dir{"", "CLIPBRIDGE_WORKING_DIR"};
        ConfigValue<bool> development{false, "CLIPBRIDGE_DEVELOPMENT"};
        ConfigValue<std::string> python_site_packages{DEFAULT_SITE_PACKAGES, "CLIPBRIDGE_SITE_PACKAGES"};
    } worker;

    struct Server {
        ConfigValue<int> port{DEFAULT_WORKER_PORT, "CLIPBRIDGE_SERVER_PORT"};
        ConfigValue<std::string> log_level{DEFAULT_LOG_LEVEL, "CLIPBRIDGE_SERVER_LOG_LEVEL"};
        ConfigValue<std::string> probe_host{DEFAULT_PROBE_HOST, "CLIPBRIDGE_PROBE_HOST"};
    } server;

    struct Client {
        ConfigValue<std::string> server_address{DEFAULT_SERVER_ADDRESS, "CLIPBRIDGE_CLIENT_SERVER_ADDRESS"};
        ConfigValue<int> port{DEFAULT_WORKER_PORT, "CLIPBRIDGE_CLIENT_PORT"};
        ConfigValue<std::string> log_level{DEFAULT_LOG_LEVEL, "CLIPBRIDGE_CLIENT_LOG_LEVEL"};
    } client;

    // All values in milliseconds
    struct Timing {
        ConfigValue<int> server_startup_timeout_ms{SERVER_STARTUP_TIMEOUT_MS, "CLIPBRIDGE_SERVER_STARTUP_TIMEOUT_MS"};
        ConfigValue<int> client_startup_timeout_ms{CLIENT_STARTUP_TIMEOUT_MS, "CLIPBRIDGE_CLIENT_STARTUP_TIMEOUT_MS"};
        ConfigValue<int> probe_delay_ms{READINESS_PROBE_DELAY_MS, "CLIPBRIDGE_PROBE_DELAY_MS"};
        ConfigValue<int> probe_timeout_ms{READINESS_PROBE_TIMEOUT_MS, "CLIPBRIDGE_PROBE_TIMEOUT_MS"};
        ConfigValue<int> stop_grace_period_ms{STOP_GRACE_PERIOD_MS, "CLIPBRIDGE_STOP_GRACE_PERIOD_MS"};
    } timing;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const ClipBridgeConfig& config() const { return config_; }
    ClipBridgeConfig& config() { return config_; }

    // Restore every value to its compiled-in default
    void reset() { config_ = ClipBridgeConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ClipBridgeConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& root);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

// Global accessor used by the CLI
const Configuration& GetConfig();

} // namespace ClipBridge

#endif // CLIPBRIDGE_COMMON_CONFIGURATION_H_
