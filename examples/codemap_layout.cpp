#include <codemap/codemap.h>
#include <codemap/common/Logger.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace codemap;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <graph.json|dataset-dir> [options]\n"
              << "  --variant combined|call|declaration   Graph to lay out from a dataset directory\n"
              << "  --direction TB|LR                     Layout direction (default TB)\n"
              << "  --config options.json                 Layout options\n"
              << "  --svg out.svg                         Write an SVG rendering\n"
              << "  --out layout.json                     Write layout JSON (default: stdout)\n"
              << "  --log-level trace|debug|info|warn|error|off\n"
              << "                                        Console/file log threshold (default: LOG_LEVEL or info)\n"
              << "  --log-dir dir                         Also append logs to dir/codemap.log\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    std::string input = argv[1];
    std::string variant = "combined";
    std::string direction;
    std::string configPath;
    std::string svgPath;
    std::string outPath;
    std::string logLevel;
    std::string logDir;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            printUsage(argv[0]);
            return 2;
        }
        if (arg == "--variant") {
            variant = argv[++i];
        } else if (arg == "--direction") {
            direction = argv[++i];
        } else if (arg == "--config") {
            configPath = argv[++i];
        } else if (arg == "--svg") {
            svgPath = argv[++i];
        } else if (arg == "--out") {
            outPath = argv[++i];
        } else if (arg == "--log-level") {
            logLevel = argv[++i];
        } else if (arg == "--log-dir") {
            logDir = argv[++i];
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    Logger::initialize(logDir, !logDir.empty());
    if (!logLevel.empty()) {
        std::optional<LogLevel> level = parseLogLevel(logLevel);
        if (!level) {
            std::cerr << "Unknown log level: " << logLevel << "\n";
            return 2;
        }
        Logger::setLevel(*level);
    }

    LayoutOptions options;
    if (!configPath.empty() && !LayoutSerializer::loadOptionsFromFile(configPath, options)) {
        std::cerr << "Cannot load options from " << configPath << "\n";
        return 1;
    }

    try {
        if (!direction.empty()) {
            options.direction = parseDirection(direction);
        }

        CodeGraph graph;
        if (std::filesystem::is_directory(input)) {
            GraphDataset dataset = GraphDataset::loadFromDirectory(input);
            graph = dataset.graph(parseVariant(variant));
        } else {
            graph = GraphReader::loadFromFile(input);
        }

        CodeGraphLayout engine(options);
        LayoutResult result = engine.layout(graph);

        if (result.empty()) {
            LOG_WARN("No data to lay out in {}", input);
        }

        if (!svgPath.empty()) {
            SvgExport svg;
            if (!svg.exportToFile(result, svgPath)) return 1;
            std::cerr << "Generated: " << svgPath << "\n";
        }

        if (!outPath.empty()) {
            if (!LayoutSerializer::saveToFile(result, outPath)) return 1;
            std::cerr << "Generated: " << outPath << "\n";
        } else if (svgPath.empty()) {
            std::cout << LayoutSerializer::toJson(result) << "\n";
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Layout failed: {}", e.what());
        Logger::flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    Logger::flush();
    return 0;
}
