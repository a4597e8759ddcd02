#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace ClipBridge {

const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["clipbridge"]) {
        LOG(WARNING) << "Configuration has no 'clipbridge' root, keeping defaults";
        return;
    }
    auto root = yaml["clipbridge"];

    // Worker
    if (root["worker"]) {
        auto worker = root["worker"];
        if (worker["python_path"]) config_.worker.python_path.set(worker["python_path"].as<std::string>());
        if (worker["server_script"]) config_.worker.server_script.set(worker["server_script"].as<std::string>());
        if (worker["client_script"]) config_.worker.client_script.set(worker["client_script"].as<std::string>());
        if (worker["standalone_dir"]) config_.worker.standalone_dir.set(worker["standalone_dir"].as<std::string>());
        if (worker["working_dir"]) config_.worker.working_dir.set(worker["working_dir"].as<std::string>());
        if (worker["development"]) config_.worker.development.set(worker["development"].as<bool>());
        if (worker["python_site_packages"]) config_.worker.python_site_packages.set(worker["python_site_packages"].as<std::string>());
    }

    // Server role
    if (root["server"]) {
        auto server = root["server"];
        if (server["port"]) config_.server.port.set(server["port"].as<int>());
        if (server["log_level"]) config_.server.log_level.set(server["log_level"].as<std::string>());
        if (server["probe_host"]) config_.server.probe_host.set(server["probe_host"].as<std::string>());
    }

    // Client role
    if (root["client"]) {
        auto client = root["client"];
        if (client["server_address"]) config_.client.server_address.set(client["server_address"].as<std::string>());
        if (client["port"]) config_.client.port.set(client["port"].as<int>());
        if (client["log_level"]) config_.client.log_level.set(client["log_level"].as<std::string>());
    }

    // Timing
    if (root["timing"]) {
        auto timing = root["timing"];
        if (timing["server_startup_timeout_ms"]) config_.timing.server_startup_timeout_ms.set(timing["server_startup_timeout_ms"].as<int>());
        if (timing["client_startup_timeout_ms"]) config_.timing.client_startup_timeout_ms.set(timing["client_startup_timeout_ms"].as<int>());
        if (timing["probe_delay_ms"]) config_.timing.probe_delay_ms.set(timing["probe_delay_ms"].as<int>());
        if (timing["probe_timeout_ms"]) config_.timing.probe_timeout_ms.set(timing["probe_timeout_ms"].as<int>());
        if (timing["stop_grace_period_ms"]) config_.timing.stop_grace_period_ms.set(timing["stop_grace_period_ms"].as<int>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate port ranges
    if (config_.server.port.get() < 1 || config_.server.port.get() > 65535) {
        validation_errors_.push_back("Server port must be between 1 and 65535");
    }
    if (config_.client.port.get() < 1 || config_.client.port.get() > 65535) {
        validation_errors_.push_back("Client port must be between 1 and 65535");
    }

    if (config_.client.server_address.get().empty()) {
        validation_errors_.push_back("Client server_address must not be empty");
    }

    // Validate timings
    if (config_.timing.server_startup_timeout_ms.get() <= 0 ||
            config_.timing.client_startup_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Startup timeouts must be positive");
    }
    if (config_.timing.probe_delay_ms.get() < 0 || config_.timing.probe_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Probe delay must be non-negative and probe timeout positive");
    }
    if (config_.timing.stop_grace_period_ms.get() <= 0) {
        validation_errors_.push_back("Stop grace period must be positive");
    }

    // Some way to launch the worker must exist
    if (config_.worker.standalone_dir.get().empty() && config_.worker.python_path.get().empty()) {
        validation_errors_.push_back("Either worker.python_path or worker.standalone_dir must be set");
    }

    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace ClipBridge
