#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace FleetLayout {

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
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
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

// Throws YAML::Exception on values of the wrong type
void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["fleetlayout"]) {
        LOG(WARNING) << "Configuration has no \"fleetlayout\" section, using defaults";
        return;
    }
    auto root = yaml["fleetlayout"];

    // Compute
    if (root["compute"]) {
        auto compute = root["compute"];
        if (compute["dram_percent"]) config_.compute.dram_percent.set(compute["dram_percent"].as<double>());
        if (compute["dram_default_mb"]) config_.compute.dram_default_mb.set(compute["dram_default_mb"].as<int>());
        if (compute["min_per_server"]) config_.compute.min_per_server.set(compute["min_per_server"].as<int>());
    }

    // Tool
    if (root["tool"]) {
        auto tool = root["tool"];
        if (tool["log_level"]) config_.tool.log_level.set(tool["log_level"].as<int>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    double percent = config_.compute.dram_percent.get();
    if (!(percent > 0.0 && percent <= 1.0)) {
        validation_errors_.push_back("Compute DRAM percent must be greater than 0 and at most 1");
    }

    if (config_.compute.dram_default_mb.get() < 1) {
        validation_errors_.push_back("Compute zone DRAM must be at least 1MB");
    }

    if (config_.compute.min_per_server.get() < 0) {
        validation_errors_.push_back("Minimum compute zones per server cannot be negative");
    }

    if (config_.tool.log_level.get() < 0) {
        validation_errors_.push_back("Log level cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

void Configuration::reset() {
    config_ = FleetLayoutConfig();
    validation_errors_.clear();
}

} // namespace FleetLayout
