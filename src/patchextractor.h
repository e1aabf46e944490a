#ifndef PATCHEXTRACTOR_H
#define PATCHEXTRACTOR_H

#include <opencv2/opencv.hpp>
#include <random>
#include "pairingresolver.h"
#include "patchfilter.h"
#include "patchwriter.h"
#include "jobstatistics.h"

/**
 * Outcome of extracting one image/mask pair
 */
struct PairResult {
    int written;            // Patches written to disk
    PairStatistics stats;
    cv::Mat image;          // Loaded source image (BGR)
    cv::Mat mask;           // Loaded binary mask (0/1)

    PairResult() : written(0) {}
};

/**
 * Per-pair grid and sampling options
 */
struct PairOptions {
    int stride;
    bool includeBorders;
    PatchFilterOptions filter;

    PairOptions() :
        stride(256),
        includeBorders(true)
    {}
};

/**
 * Runs the full patch pipeline for a single image/mask pair:
 * load, generate origins, filter and sample, write.
 */
class PatchExtractor
{
public:
    /**
     * Extract and write the patches of one pair
     * @param pair Source image and mask
     * @param writer Destination of the kept patches
     * @param options Grid, filter and sampling options
     * @param rng Job-wide random engine used for sampling
     * @return Written count, statistics and the loaded arrays
     * @throws std::runtime_error if a file cannot be read or written
     */
    static PairResult extractPair(const ImageMaskPair& pair,
                                  const PatchWriter& writer,
                                  const PairOptions& options,
                                  std::mt19937& rng);
};

#endif // PATCHEXTRACTOR_H
