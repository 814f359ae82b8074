#include "gridform/config/GridConfigParser.hpp"
#include "gridform/layout/GridPlacer.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace gform;

static bool verbose = false;

void printUsage(const char* program_name) {
    std::cout << "gridform - grid layout and constraint language interpreter\n"
              << "Usage: " << program_name << " [options]\n"
              << "\nOptions:\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << "  -c, --config <path>     Load a .grid config file\n"
              << "  -l, --layout <text>     Layout string (overrides the config layout)\n"
              << "  -d, --defaults <text>   Extra default constraints\n"
              << "  -r, --region <name>     Only print this region\n"
              << "  --verbose               Trace what is being loaded\n"
              << std::endl;
}

void printVersion() {
    std::cout << "gridform v0.1.0\n"
              << "Built with C++20\n"
              << std::endl;
}

void trace(const std::string& message) {
    if (verbose) {
        std::cerr << "[gridform] " << message << std::endl;
    }
}

void printPlacement(const Region& region, const Placement& placement) {
    std::cout << region.name << " @ row " << region.row << ", col " << region.col
              << " w=" << region.width << " h=" << region.height;
    if (!region.constraints.empty()) {
        std::cout << " embedded={" << region.constraints << "}";
    }
    std::cout << "\n    " << formatConstraints(placement.constraints) << std::endl;
}

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> layout_text;
    std::optional<std::string> extra_defaults;
    std::optional<std::string> only_region;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            printVersion();
            return 0;
        }

        if (arg == "--verbose") {
            verbose = true;
            continue;
        }

        if (arg == "-c" || arg == "--config" ||
            arg == "-l" || arg == "--layout" ||
            arg == "-d" || arg == "--defaults" ||
            arg == "-r" || arg == "--region") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "-c" || arg == "--config") {
                config_path = value;
            } else if (arg == "-l" || arg == "--layout") {
                layout_text = value;
            } else if (arg == "-d" || arg == "--defaults") {
                extra_defaults = value;
            } else {
                only_region = value;
            }
            continue;
        }

        std::cerr << "Error: unknown option " << arg << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    GridConfigParser config_parser;

    if (!config_path && !layout_text) {
        config_path = GridConfigParser::getDefaultConfigPath();
    }

    if (config_path) {
        trace("loading config " + config_path->string());
        if (!config_parser.load(*config_path)) {
            std::cerr << "Failed to load configuration" << std::endl;
            return 1;
        }
    }

    GridConfig& config = config_parser.getConfigMutable();
    if (layout_text) {
        config.layout = *layout_text;
    }
    if (extra_defaults) {
        config.defaults = buildConstraintString({config.defaults, *extra_defaults});
    }

    trace("layout: " + config.layout);
    trace("defaults: " + config.defaults);

    try {
        GridPlacer placer = config_parser.makePlacer();
        if (!placer.hasLayout()) {
            std::cerr << "Error: no layout given" << std::endl;
            return 1;
        }

        const RegionRegistry& registry = *placer.getLayout();
        trace("parsed " + std::to_string(registry.size()) + " regions");

        if (only_region && !registry.contains(*only_region)) {
            std::cerr << "Error: no region named " << *only_region << " in layout" << std::endl;
            return 1;
        }

        for (const auto& region : registry) {
            if (only_region && region.name != *only_region) {
                continue;
            }
            std::vector<ConstraintPart> overrides;
            if (auto extra = config.overrideFor(region.name)) {
                overrides.emplace_back(*extra);
            }
            printPlacement(region, placer.placeRegion(region, overrides));
        }

    } catch (const ConstraintError& e) {
        std::cerr << "Constraint error (" << constraintErrorKindToString(e.kind()) << "): "
                  << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
