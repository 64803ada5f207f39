#pragma once

#include <string>
#include <vector>

#include "fleet_config.h"

namespace YAML {
class Node;
}

namespace FleetLayout {

/**
 * Loads a FleetConfig from a file, from YAML or JSON text, or from an already
 * parsed YAML::Node, and validates it. Loading stops at the first problem
 * found, so a failed load always reports exactly one error.
 *
 * A loader can be used only once:
 *
 *     FleetConfigLoader loader;
 *     if (!loader.LoadFromFile(path)) {
 *         LOG(ERROR) << loader.error();
 *         return 1;
 *     }
 *     Layout layout = GenerateLayout(loader.config(), images);
 */
class FleetConfigLoader {
public:
    FleetConfigLoader() = default;
    FleetConfigLoader(const FleetConfigLoader&) = delete;
    FleetConfigLoader& operator=(const FleetConfigLoader&) = delete;

    bool LoadFromFile(const std::string& filename);
    bool LoadFromString(const std::string& text);
    bool LoadDirectly(const YAML::Node& config);

    // Only valid after a successful load
    const FleetConfig& config() const;

    // Why the load failed, empty if it succeeded
    const std::string& error() const;

private:
    void Begin(const std::string& source);
    void ParseText(const std::string& text);
    void Parse(const YAML::Node& parsed);
    bool CheckImages(const YAML::Node& images);
    void AddServer(const YAML::Node& server);
    void ComputeDerived();
    bool Finish();

    FleetConfig config_;
    // Human-readable description of where the input came from
    std::string source_;
    std::vector<std::string> errors_;
    bool started_ = false;
    bool done_ = false;
};

} // namespace FleetLayout
