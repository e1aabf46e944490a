#ifndef PATCHFILTER_H
#define PATCHFILTER_H

#include <opencv2/opencv.hpp>
#include <random>
#include <vector>
#include "patchgrid.h"

/**
 * Options of the coverage filter and the per-image sampler
 */
struct PatchFilterOptions {
    int patchSize;
    double minMaskRatio;        // Minimum foreground fraction in [0, 1]
    bool applyMinMaskRatio;     // false keeps every in-bounds patch
    int maxPatches;             // Per-image cap, 0 = unlimited

    PatchFilterOptions() :
        patchSize(256),
        minMaskRatio(0.0),
        applyMinMaskRatio(true),
        maxPatches(0)
    {}
};

/**
 * Evaluation of one candidate origin
 */
struct PatchRecord {
    PatchCoordinate coord;
    double coverage;
    bool keep;
};

struct PatchFilterResult {
    int totalCoords;                        // Candidates, including out-of-bounds ones
    std::vector<PatchCoordinate> kept;      // Sorted by (y, x)
    std::vector<PatchRecord> records;       // One per in-bounds candidate, before sampling
    double coverageMean;                    // Over all in-bounds candidates, 0 if none

    PatchFilterResult() : totalCoords(0), coverageMean(0.0) {}
};

/**
 * Mask-coverage filter and random sampler for patch candidates
 */
class PatchFilter
{
public:
    /**
     * Fraction of foreground pixels in a binary mask region
     * @param maskRegion CV_8UC1 region holding 0/1 values
     * @return Mean value in [0, 1], 0 for an empty region
     */
    static double coverageRatio(const cv::Mat& maskRegion);

    /**
     * Score the candidates of one image and choose the patches to keep
     *
     * Candidates whose patch leaves the image or the mask are dropped
     * without being scored. When more than options.maxPatches candidates
     * survive, a random subset of exactly that size is drawn from rng.
     * @param mask Binary mask (CV_8UC1, 0/1)
     * @param imageSize Size of the source image
     * @param coords Candidate origins
     * @param options Filter options
     * @param rng Job-wide random engine, advanced only when sampling
     * @return Kept origins and statistics
     */
    static PatchFilterResult filter(const cv::Mat& mask,
                                    const cv::Size& imageSize,
                                    const std::vector<PatchCoordinate>& coords,
                                    const PatchFilterOptions& options,
                                    std::mt19937& rng);

    /**
     * Check whether a patch at coord lies inside an area of the given size
     */
    static bool fits(const PatchCoordinate& coord, int patchSize, const cv::Size& area);
};

#endif // PATCHFILTER_H
