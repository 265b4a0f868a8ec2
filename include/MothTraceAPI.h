#ifndef MOTH_TRACE_API_H
#define MOTH_TRACE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define MOTH_TRACE_VERSION_MAJOR 1
#define MOTH_TRACE_VERSION_MINOR 0
#define MOTH_TRACE_VERSION_PATCH 0

// Error codes
typedef enum {
    MOTH_TRACE_SUCCESS = 0,
    MOTH_TRACE_ERROR_INVALID_INPUT = -1,
    MOTH_TRACE_ERROR_FILE_NOT_FOUND = -2,
    MOTH_TRACE_ERROR_IMAGE_LOAD_FAILED = -3,
    MOTH_TRACE_ERROR_THRESHOLDING_FAILED = -4,
    MOTH_TRACE_ERROR_NO_REGIONS = -5,
    MOTH_TRACE_ERROR_INVALID_PARAMETERS = -6,
    MOTH_TRACE_ERROR_WRITE_FAILED = -7,
    MOTH_TRACE_ERROR_PROCESSING_FAILED = -8
} MothTraceResult;

// Processing parameters structure
typedef struct {
    int32_t first_pass_bins;                // Otsu bins for the red channel pass (default: 60)
    int32_t second_pass_bins;               // Otsu bins for the saturation pass (default: 256)

    double tag_area_fraction;               // Tag window left bound as fraction of width (default: 0.5)
    int32_t max_tag_regions;                // Largest tag regions considered (default: 3)
    int32_t tag_erosion_iterations;         // Erosions before tag labeling (default: 1)

    int32_t antenna_dilation_iterations;    // Dilation iterations for antenna bridges (default: 35)
    double inner_search_height_fraction;    // Inner pixel search window height (default: 0.75)

    bool enable_debug_output;               // Enable debug image output (default: false)
    bool verbose_output;                    // Enable [INFO] console output (default: false)
} MothTraceParams;

// Landmark coordinate, whole-silhouette frame
typedef struct {
    int32_t row;
    int32_t col;
} MothTracePoint;

typedef struct {
    MothTracePoint outer_pix_l;
    MothTracePoint inner_pix_l;
    MothTracePoint outer_pix_r;
    MothTracePoint inner_pix_r;
    MothTracePoint body_center;
    int32_t mask_rows;                      // Silhouette mask height
    int32_t mask_cols;                      // Silhouette mask width
} MothTraceLandmarks;

// Progress callback function type
typedef void (*MothTraceProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*MothTraceErrorCallback)(MothTraceResult error_code, const char* error_message);

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void moth_trace_get_default_params(MothTraceParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return MOTH_TRACE_SUCCESS if valid, error code otherwise
 */
MothTraceResult moth_trace_validate_params(const MothTraceParams* params);

/**
 * Binarize a specimen photograph and extract its landmarks
 * @param input_path Path to input image file
 * @param top_ruler Row of the ruler top edge (from ruler detection)
 * @param params Processing parameters (defaults if NULL)
 * @param landmarks Landmarks structure to fill
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback for detailed error reporting
 * @return MOTH_TRACE_SUCCESS if successful, error code otherwise
 */
MothTraceResult moth_trace_process_image(
    const char* input_path,
    int32_t top_ruler,
    const MothTraceParams* params,
    MothTraceLandmarks* landmarks,
    MothTraceProgressCallback progress_callback,
    MothTraceErrorCallback error_callback
);

/**
 * Save landmarks to a YAML or JSON file (chosen by extension)
 * @param landmarks Landmarks to save
 * @param output_path Output file path
 * @param error_callback Optional error callback
 * @return MOTH_TRACE_SUCCESS if successful, error code otherwise
 */
MothTraceResult moth_trace_save_landmarks(
    const MothTraceLandmarks* landmarks,
    const char* output_path,
    MothTraceErrorCallback error_callback
);

/**
 * Get human-readable error message for error code
 * @return Static string describing the error (do not free)
 */
const char* moth_trace_get_error_message(MothTraceResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* moth_trace_get_version(void);

/**
 * Check if input file appears to be a valid image
 * @return true if file can be decoded as an image, false otherwise
 */
bool moth_trace_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // MOTH_TRACE_API_H
