#ifndef FLEETLAYOUT_CONFIGURATION_H_
#define FLEETLAYOUT_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>

#include "config.h"

namespace YAML {
class Node;
}

namespace FleetLayout {

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
 * Tunables for the layout generator and the genconfig tool
 */
struct FleetLayoutConfig {
    // Compute zones placed on storage servers
    struct Compute {
        // Fraction of each storage server's DRAM handed to compute zones
        ConfigValue<double> dram_percent{COMPUTE_DRAM_PERCENT, "FLEETLAYOUT_COMPUTE_DRAM_PERCENT"};
        // DRAM each compute zone gets by default (megabytes)
        ConfigValue<int> dram_default_mb{COMPUTE_DRAM_DEFAULT_MB, "FLEETLAYOUT_COMPUTE_DRAM_DEFAULT_MB"};
        ConfigValue<int> min_per_server{COMPUTE_MIN_PER_SERVER, "FLEETLAYOUT_COMPUTE_MIN_PER_SERVER"};
    } compute;

    struct Tool {
        // Verbose logging level (FLAGS_v)
        ConfigValue<int> log_level{0, "FLEETLAYOUT_LOG_LEVEL"};
    } tool;
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
    const FleetLayoutConfig& config() const { return config_; }
    FleetLayoutConfig& config() { return config_; }

    // Helper methods for common access patterns
    double getComputeDramPercent() const { return config_.compute.dram_percent.get(); }
    int getComputeDramDefaultMb() const { return config_.compute.dram_default_mb.get(); }
    int getComputeMinPerServer() const { return config_.compute.min_per_server.get(); }
    int getLogLevel() const { return config_.tool.log_level.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restores every value to its built-in default (tests)
    void reset();

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    FleetLayoutConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

} // namespace FleetLayout

#endif // FLEETLAYOUT_CONFIGURATION_H_
