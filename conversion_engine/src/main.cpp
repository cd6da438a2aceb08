// spatBridge patch converter
//
// reads a visual patch (JSON) and an optional speaker geometry file,
// analyzes signal routing and spatial intent, and writes the generated
// spatial-audio parameter objects (WFS / VBAP / HOA) for the target engine
//
// exit codes: 0 ok, 1 bad arguments, 2 load/write failure, 3 routing failure

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "ConversionErrors.hpp"
#include "ConversionPipeline.hpp"
#include "PatchLoader.hpp"
#include "SpeakerConfigLoader.hpp"

namespace fs = std::filesystem;

void printUsage() {
    std::cout << "spatBridge Patch Converter\n\n";
    std::cout << "Usage:\n"
              << "  spatBridge_convert \\\n"
              << "    --patch patch.maxpat \\\n"
              << "    [--speakers speakers.txt] \\\n"
              << "    [--out output.scd] \\\n"
              << "    [OPTIONS]\n\n";
    std::cout << "Required:\n"
              << "  --patch FILE          Patch JSON file\n\n";
    std::cout << "Optional inputs/outputs:\n"
              << "  --speakers FILE       Speaker geometry file (OSC-style text)\n"
              << "  --out FILE            Output file (default: stdout)\n\n";
    std::cout << "Conversion Options:\n"
              << "  --skip_spatial        Do not analyze or convert spatial objects\n"
              << "  --skip_multichannel   Ignore speaker arrays (no WFS/VBAP layouts)\n"
              << "  --no_osc              Do not generate OSC responders\n"
              << "  --simplified          Basic HOA decoder and 2D VBAP panner\n"
              << "  --temperature C       Air temperature for WFS math (default: 20)\n"
              << "  --sc_version V        Target engine version tag (default: 3.13)\n\n";
    std::cout << "Analysis Options:\n"
              << "  --max_depth N         Max audio edges per signal chain (default: 64)\n"
              << "  --max_chains N        Max signal chains reported (default: 1024)\n"
              << "  --verbose             Per-node and per-chain logging\n"
              << "  --help                Show this help message\n";
}

int main(int argc, char *argv[]) {

    if (argc < 3) {
        printUsage();
        return 1;
    }

    fs::path patchFile, speakerFile, outFile;
    ConversionOptions options;   // defaults run every stage

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            // flags that take a value
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else if (arg == "--patch") {
                patchFile = value();
            } else if (arg == "--speakers") {
                speakerFile = value();
            } else if (arg == "--out") {
                outFile = value();
            } else if (arg == "--skip_spatial") {
                options.skipSpatial = true;
            } else if (arg == "--skip_multichannel") {
                options.skipMultichannel = true;
            } else if (arg == "--no_osc") {
                options.generateOsc = false;
            } else if (arg == "--simplified") {
                options.simplified = true;
            } else if (arg == "--verbose") {
                options.verbose = true;
            } else if (arg == "--temperature") {
                options.temperatureCelsius = std::stof(value());
                if (options.temperatureCelsius < -40.0f || options.temperatureCelsius > 60.0f) {
                    std::cerr << "Warning: --temperature " << options.temperatureCelsius
                              << " is outside recommended range [-40, 60]\n";
                }
            } else if (arg == "--sc_version") {
                options.scVersion = value();
            } else if (arg == "--max_depth") {
                options.pathLimits.maxDepth = std::stoi(value());
                if (options.pathLimits.maxDepth < 1) {
                    std::cerr << "Error: --max_depth must be at least 1\n";
                    return 1;
                }
            } else if (arg == "--max_chains") {
                options.pathLimits.maxChains = std::stoi(value());
                if (options.pathLimits.maxChains < 1) {
                    std::cerr << "Error: --max_chains must be at least 1\n";
                    return 1;
                }
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::logic_error &e) {
        // std::stoi / std::stof failures and missing values
        std::cerr << "Error: bad argument: " << e.what() << "\n";
        return 1;
    }

    if (patchFile.empty()) {
        std::cerr << "Error: --patch is required\n";
        printUsage();
        return 1;
    }

    std::cout << "Loading patch: " << patchFile << "\n";
    PatchData patch;
    std::optional<SpeakerConfigData> speakers;
    try {
        patch = PatchLoader::loadPatch(patchFile.string());
        if (!speakerFile.empty()) {
            std::cout << "Loading speaker configuration: " << speakerFile << "\n";
            speakers = SpeakerConfigLoader::loadSpeakerConfig(speakerFile.string());
        }
    } catch (const std::runtime_error &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    std::cout << "  " << patch.boxes.size() << " boxes, " << patch.lines.size() << " cables\n";

    ConversionResult result;
    try {
        result = ConversionPipeline::run(patch, speakers ? &*speakers : nullptr, options);
    } catch (const AnalysisError &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    std::cout << "\nSummary:\n"
              << "  nodes:          " << result.summary.nodes << "\n"
              << "  edges:          " << result.summary.edges << " ("
              << result.summary.audioEdges << " audio, " << result.summary.controlEdges << " control, "
              << result.summary.messageEdges << " message)\n"
              << "  audio sources:  " << result.summary.audioSources << "\n"
              << "  audio sinks:    " << result.summary.audioSinks << "\n"
              << "  signal chains:  " << result.chains.size() << "\n"
              << "  method:         " << processingMethodName(result.spatialConfig.processingMethod) << "\n"
              << "  objects:        " << result.objects.size() << "\n"
              << "  box objects:    " << result.boxObjects.size() << "\n"
              << "  warnings:       " << result.warnings.size() << "\n"
              << "  errors:         " << result.errors.size() << "\n";

    std::string code = "// generated by spatBridge for SuperCollider " + options.scVersion + "\n"
                     + ConversionPipeline::render(result);

    if (outFile.empty()) {
        std::cout << "\n" << code;
        return 0;
    }

    if (outFile.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(outFile.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: cannot create " << outFile.parent_path() << ": " << ec.message() << "\n";
            return 2;
        }
    }

    std::ofstream out(outFile);
    if (!out) {
        std::cerr << "Error: cannot write " << outFile << "\n";
        return 2;
    }
    out << code;
    std::cout << "Wrote " << outFile << "\n";
    return 0;
}
