#include "MothTraceAPI.h"
#include "Binarizer.hpp"
#include "ImageUtils.hpp"
#include "LandmarkDetector.hpp"
#include "MothTraceErrors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <iostream>

using namespace MothTrace;

// Internal helper functions
namespace {

    // Convert C parameters to C++ parameters
    ProcessingParams convertParams(const MothTraceParams* params) {
        ProcessingParams cpp_params;
        if (params) {
            cpp_params.firstPassBins = params->first_pass_bins;
            cpp_params.secondPassBins = params->second_pass_bins;

            cpp_params.tagAreaFraction = params->tag_area_fraction;
            cpp_params.maxTagRegions = params->max_tag_regions;
            cpp_params.tagErosionIterations = params->tag_erosion_iterations;

            cpp_params.antennaDilationIterations = params->antenna_dilation_iterations;
            cpp_params.innerSearchHeightFraction = params->inner_search_height_fraction;

            cpp_params.enableDebugOutput = params->enable_debug_output;
            cpp_params.verboseOutput = params->verbose_output;
        }
        return cpp_params;
    }

    MothTracePoint convertPoint(const PixelCoord& p) {
        MothTracePoint point;
        point.row = p.row;
        point.col = p.col;
        return point;
    }

    PixelCoord convertPoint(const MothTracePoint& p) {
        return PixelCoord{p.row, p.col};
    }

    void reportError(MothTraceErrorCallback callback, MothTraceResult code, const char* message) {
        if (callback) {
            callback(code, message);
        }
    }

    // Progress reporting helper
    void reportProgress(MothTraceProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }
}

// API Implementation

void moth_trace_get_default_params(MothTraceParams* params) {
    if (!params) return;

    ProcessingParams defaults;
    params->first_pass_bins = defaults.firstPassBins;
    params->second_pass_bins = defaults.secondPassBins;

    params->tag_area_fraction = defaults.tagAreaFraction;
    params->max_tag_regions = defaults.maxTagRegions;
    params->tag_erosion_iterations = defaults.tagErosionIterations;

    params->antenna_dilation_iterations = defaults.antennaDilationIterations;
    params->inner_search_height_fraction = defaults.innerSearchHeightFraction;

    params->enable_debug_output = defaults.enableDebugOutput;
    params->verbose_output = defaults.verboseOutput;
}

MothTraceResult moth_trace_validate_params(const MothTraceParams* params) {
    if (!params) return MOTH_TRACE_ERROR_INVALID_PARAMETERS;

    try {
        validateParams(convertParams(params));
    } catch (const std::invalid_argument&) {
        return MOTH_TRACE_ERROR_INVALID_PARAMETERS;
    }
    return MOTH_TRACE_SUCCESS;
}

MothTraceResult moth_trace_process_image(
    const char* input_path,
    int32_t top_ruler,
    const MothTraceParams* params,
    MothTraceLandmarks* landmarks,
    MothTraceProgressCallback progress_callback,
    MothTraceErrorCallback error_callback
) {
    if (!input_path || !landmarks) {
        reportError(error_callback, MOTH_TRACE_ERROR_INVALID_INPUT, "Invalid input parameters");
        return MOTH_TRACE_ERROR_INVALID_INPUT;
    }

    // Check file exists
    std::ifstream file(input_path);
    if (!file.good()) {
        reportError(error_callback, MOTH_TRACE_ERROR_FILE_NOT_FOUND, "Input file not found or not readable");
        return MOTH_TRACE_ERROR_FILE_NOT_FOUND;
    }

    // Validate parameters
    MothTraceParams default_params;
    if (!params) {
        moth_trace_get_default_params(&default_params);
        params = &default_params;
    }

    MothTraceResult validation_result = moth_trace_validate_params(params);
    if (validation_result != MOTH_TRACE_SUCCESS) {
        reportError(error_callback, validation_result, "Invalid processing parameters");
        return validation_result;
    }

    ProcessingParams cpp_params = convertParams(params);

    cv::Mat image;
    try {
        reportProgress(progress_callback, 0.0, "Loading image");
        image = ImageUtils::loadImage(input_path);
    } catch (const std::exception& e) {
        reportError(error_callback, MOTH_TRACE_ERROR_IMAGE_LOAD_FAILED, e.what());
        return MOTH_TRACE_ERROR_IMAGE_LOAD_FAILED;
    }

    try {
        reportProgress(progress_callback, 0.2, "Binarizing specimen");
        cv::Mat silhouette = Binarizer::binarize(image, top_ruler, cpp_params);

        reportProgress(progress_callback, 0.6, "Detecting landmarks");
        LandmarksResult result = LandmarkDetector::detectLandmarks(silhouette, cpp_params);
        ImageUtils::flushDebugStack(cpp_params);

        landmarks->outer_pix_l = convertPoint(result.outerPixL());
        landmarks->inner_pix_l = convertPoint(result.innerPixL());
        landmarks->outer_pix_r = convertPoint(result.outerPixR());
        landmarks->inner_pix_r = convertPoint(result.innerPixR());
        landmarks->body_center = convertPoint(result.bodyCenter());
        landmarks->mask_rows = silhouette.rows;
        landmarks->mask_cols = silhouette.cols;

        reportProgress(progress_callback, 1.0, "Landmark detection complete");
        return MOTH_TRACE_SUCCESS;

    } catch (const ThresholdingFailed& e) {
        reportError(error_callback, MOTH_TRACE_ERROR_THRESHOLDING_FAILED, e.what());
        return MOTH_TRACE_ERROR_THRESHOLDING_FAILED;
    } catch (const NoRegionsFound& e) {
        reportError(error_callback, MOTH_TRACE_ERROR_NO_REGIONS, e.what());
        return MOTH_TRACE_ERROR_NO_REGIONS;
    } catch (const std::invalid_argument& e) {
        reportError(error_callback, MOTH_TRACE_ERROR_INVALID_INPUT, e.what());
        return MOTH_TRACE_ERROR_INVALID_INPUT;
    } catch (const std::exception& e) {
        reportError(error_callback, MOTH_TRACE_ERROR_PROCESSING_FAILED, e.what());
        return MOTH_TRACE_ERROR_PROCESSING_FAILED;
    }
}

MothTraceResult moth_trace_save_landmarks(
    const MothTraceLandmarks* landmarks,
    const char* output_path,
    MothTraceErrorCallback error_callback
) {
    if (!landmarks || !output_path) {
        reportError(error_callback, MOTH_TRACE_ERROR_INVALID_INPUT, "Invalid landmarks or output path");
        return MOTH_TRACE_ERROR_INVALID_INPUT;
    }

    try {
        LandmarksResult result(
            convertPoint(landmarks->outer_pix_l),
            convertPoint(landmarks->inner_pix_l),
            convertPoint(landmarks->outer_pix_r),
            convertPoint(landmarks->inner_pix_r),
            convertPoint(landmarks->body_center)
        );
        writeLandmarks(result, output_path);
        return MOTH_TRACE_SUCCESS;

    } catch (const std::exception& e) {
        reportError(error_callback, MOTH_TRACE_ERROR_WRITE_FAILED, e.what());
        return MOTH_TRACE_ERROR_WRITE_FAILED;
    }
}

const char* moth_trace_get_error_message(MothTraceResult error_code) {
    switch (error_code) {
        case MOTH_TRACE_SUCCESS: return "Success";
        case MOTH_TRACE_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case MOTH_TRACE_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case MOTH_TRACE_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case MOTH_TRACE_ERROR_THRESHOLDING_FAILED: return "Thresholding failed - image has no usable contrast";
        case MOTH_TRACE_ERROR_NO_REGIONS: return "No regions found - image needs manual review";
        case MOTH_TRACE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case MOTH_TRACE_ERROR_WRITE_FAILED: return "Failed to write landmark file - check output path permissions";
        case MOTH_TRACE_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* moth_trace_get_version(void) {
    return "1.0.0";
}

bool moth_trace_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Could not decode " << file_path << ": " << e.what() << std::endl;
        return false;
    }
}
