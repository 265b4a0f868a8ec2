#include "Binarizer.hpp"
#include "ImageUtils.hpp"
#include "LandmarkDetector.hpp"
#include "MothTraceAPI.h"
#include "MothTraceErrors.hpp"
#include "RenderSurface.hpp"
#include "ResultCache.hpp"
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std;
using namespace MothTrace;

struct Arguments {
    string inputPath;
    string outputPath;
    string overlayPath;
    string cacheDir;
    int topRuler = -1;
    int dilationIterations = 35;
    bool valid = false;
    bool verbose = false;
    bool debug = false;
};

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
            args.inputPath = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && (i + 1 < argc)) {
            args.outputPath = argv[++i];
        } else if ((arg == "-r" || arg == "--top-ruler") && (i + 1 < argc)) {
            args.topRuler = stoi(argv[++i]);
        } else if ((arg == "--overlay") && (i + 1 < argc)) {
            args.overlayPath = argv[++i];
        } else if ((arg == "--cache-dir") && (i + 1 < argc)) {
            args.cacheDir = argv[++i];
        } else if ((arg == "--dilation-iterations") && (i + 1 < argc)) {
            args.dilationIterations = stoi(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            return args; // Will trigger usage display
        }
    }

    if (args.inputPath.empty() || args.topRuler <= 0) {
        return args;
    }

    // Auto-generate output path if not provided
    if (args.outputPath.empty()) {
        size_t dotPos = args.inputPath.find_last_of('.');
        if (dotPos == string::npos) {
            args.outputPath = args.inputPath + ".yml";
        } else {
            args.outputPath = args.inputPath.substr(0, dotPos) + ".yml";
        }
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "MothTrace CLI - Landmarks from photographs of mounted lepidoptera\n"
         << "Using libmothtrace v" << moth_trace_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> -r <top_ruler> [-o <landmarks.yml>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input      Input image file path\n"
         << "  -r, --top-ruler  Row of the ruler top edge\n"
         << "\n"
         << "Optional:\n"
         << "  -o, --output     Output landmark file, .yml or .json (auto-generated if not specified)\n"
         << "  --overlay <png>  Save the antenna-free mask with midline and landmarks\n"
         << "  --cache-dir <dir>  Reuse results stored in this directory\n"
         << "  --dilation-iterations <n>  Antenna bridge dilation (default: 35)\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Enable debug visualization (saves step-by-step images)\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i specimen.jpg -r 2150\n"
         << "  " << progName << " -i specimen.jpg -r 2150 -o points.json --overlay points.png\n"
         << "  " << progName << " -i specimen.jpg -r 2150 --cache-dir ./cachedir -v\n"
         << endl;
}

int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parseArguments(argc, argv);
    } catch (const exception& e) {
        cerr << "[ERROR] Invalid numeric argument: " << e.what() << endl;
        return 1;
    }

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] MothTrace CLI v" << moth_trace_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.outputPath << endl;
    }

    if (!std::ifstream(args.inputPath).good()) {
        cerr << "[ERROR] Input file does not exist or is not readable: " << args.inputPath << endl;
        return 1;
    }

    ProcessingParams params;
    params.verboseOutput = args.verbose;
    params.enableDebugOutput = args.debug;
    params.antennaDilationIterations = args.dilationIterations;
    if (args.debug) {
        cout << "[INFO] Debug mode enabled - images will be saved to " << params.debugOutputPath << endl;
    }

    unique_ptr<ResultCache> cache;
    if (!args.cacheDir.empty()) {
        cache = make_unique<DirectoryResultCache>(args.cacheDir);
        if (args.verbose) cout << "[INFO] Using result cache in " << args.cacheDir << endl;
    }

    try {
        validateParams(params);

        cv::Mat image = ImageUtils::loadImage(args.inputPath);
        cv::Mat silhouette = binarizeCached(image, args.topRuler, params, cache.get());

        MatRenderSurface overlay;
        vector<RenderSurface*> surfaces;
        if (!args.overlayPath.empty()) {
            surfaces = {nullptr, nullptr, &overlay};
        }

        LandmarksResult result = detectLandmarksCached(silhouette, params, cache.get(), surfaces);
        ImageUtils::flushDebugStack(params);

        cout << "[INFO] Landmarks (row, col):\n" << result.toString();
        writeLandmarks(result, args.outputPath);

        if (!args.overlayPath.empty() && !overlay.save(args.overlayPath)) {
            cerr << "[ERROR] Failed to save overlay image." << endl;
            return 1;
        }

        cout << "[SUCCESS] Landmark extraction completed successfully!" << endl;
        cout << "[INFO] Output saved to: " << args.outputPath << endl;

    } catch (const ThresholdingFailed& e) {
        cerr << "[ERROR] Thresholding failed, route to manual review: " << e.what() << endl;
        return 1;
    } catch (const NoRegionsFound& e) {
        cerr << "[ERROR] No usable regions, route to manual review: " << e.what() << endl;
        return 1;
    } catch (const invalid_argument& e) {
        cerr << "[ERROR] Invalid argument: " << e.what() << endl;
        return 1;
    } catch (const runtime_error& e) {
        cerr << "[ERROR] Processing failed: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "[ERROR] Unexpected error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
