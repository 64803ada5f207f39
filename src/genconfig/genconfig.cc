#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

// Project includes
#include "../common/configuration.h"
#include "../fleet/fleet_config_loader.h"
#include "../layout/layout_generator.h"

using namespace FleetLayout;

namespace {

// Reads a YAML (or JSON) mapping of service name to image.
bool LoadImages(const std::string& filename, ImageMap& images) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (!yaml.IsMap()) {
            LOG(ERROR) << "images file " << filename << ": expected a mapping of service name to image";
            return false;
        }
        for (const auto& kv : yaml) {
            std::string svcname = kv.first.as<std::string>();
            if (!ServiceNameIsValid(svcname)) {
                LOG(ERROR) << "images file " << filename << ": images[" << svcname
                           << "]: invalid service name";
                return false;
            }
            images[svcname] = kv.second.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to read images file " << filename << ": " << e.what();
        return false;
    }
    return true;
}

bool WriteConfig(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path);
    if (!out.is_open()) {
        LOG(ERROR) << "write \"" << path.string() << "\": " << strerror(errno);
        return false;
    }
    out << contents;
    out.close();
    if (out.fail()) {
        LOG(ERROR) << "write \"" << path.string() << "\": " << strerror(errno);
        return false;
    }
    return true;
}

bool LoadConfiguration(const cxxopts::ParseResult& arguments) {
    Configuration& config = Configuration::getInstance();
    bool ok = arguments.count("config") ?
        config.loadFromFile(arguments["config"].as<std::string>()) : config.validate();
    if (!ok) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Config validation error: " << error;
        }
    }
    return ok;
}

int Run(const cxxopts::ParseResult& arguments) {
    if (!LoadConfiguration(arguments)) {
        return 1;
    }
    const Configuration& config = Configuration::getInstance();
    FLAGS_v = arguments.count("log_level") ? arguments["log_level"].as<int>() : config.getLogLevel();

    if (!arguments.count("from-file")) {
        LOG(ERROR) << "--from-file is required";
        return 2;
    }

    ImageMap images = DefaultImageMap();
    if (arguments.count("images")) {
        images.clear();
        if (!LoadImages(arguments["images"].as<std::string>(), images)) {
            return 1;
        }
    }

    FleetConfigLoader loader;
    if (!loader.LoadFromFile(arguments["from-file"].as<std::string>())) {
        std::cerr << "error: " << loader.error() << "\n";
        return 1;
    }

    Layout layout = GenerateLayout(loader.config(), images, LayoutParameters::FromConfiguration(config));
    if (layout.nerrors() > 0) {
        layout.PrintIssues(std::cerr);
        std::cerr << "error: bailing out because of at least one issue\n";
        return 1;
    }

    // The loader guarantees at least one server, so at least one AZ.
    std::vector<std::string> azs = layout.Azs();
    if (!arguments.count("out-dir")) {
        if (azs.size() != 1) {
            std::cerr << "error: output directory must be specified when generating a "
                      << "configuration with more than one availability zone\n";
            return 1;
        }
        std::optional<std::string> generated = layout.Serialize(azs[0]);
        if (!generated.has_value()) {
            return 1;
        }
        std::cout << *generated;
    } else {
        std::filesystem::path outdir(arguments["out-dir"].as<std::string>());
        for (const auto& az : azs) {
            std::optional<std::string> generated = layout.Serialize(az);
            if (!generated.has_value() || !WriteConfig(outdir / az, *generated)) {
                return 1;
            }
            std::cerr << "wrote config for \"" << az << "\"\n";
        }
    }

    if (arguments.count("out-dir") || arguments.count("summary")) {
        std::cerr << "\nSummary of generated configuration:\n\n";
        layout.PrintSummary(std::cerr);
        std::cerr << "\n";
    }

    layout.PrintIssues(std::cerr);
    return 0;
}

} // end of namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files

    cxxopts::Options options("fleetlayout-genconfig",
            "Lay out services across the servers, racks and availability zones of a fleet");

    options.add_options()
        ("f,from-file", "Use server descriptions in FILE", cxxopts::value<std::string>())
        ("i,images", "YAML mapping of service name to image (default: placeholder images)",
         cxxopts::value<std::string>())
        ("o,out-dir", "Write one configuration per availability zone into DIR",
         cxxopts::value<std::string>())
        ("c,config", "fleetlayout configuration file", cxxopts::value<std::string>())
        ("s,summary", "Print a summary of the generated configuration")
        ("l,log_level", "Log level", cxxopts::value<int>())
        ("h,help", "Print usage");

    std::optional<cxxopts::ParseResult> arguments;
    try {
        arguments.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        LOG(ERROR) << e.what();
        std::cerr << options.help() << std::endl;
        return 2;
    }

    if (arguments->count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    return Run(*arguments);
}
