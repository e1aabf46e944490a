#include "patchfilter.h"
#include <algorithm>

double PatchFilter::coverageRatio(const cv::Mat& maskRegion)
{
    if (maskRegion.empty()) {
        return 0.0;
    }
    return cv::mean(maskRegion)[0];
}

bool PatchFilter::fits(const PatchCoordinate& coord, int patchSize, const cv::Size& area)
{
    return coord.y >= 0 && coord.x >= 0
        && coord.y + patchSize <= area.height
        && coord.x + patchSize <= area.width;
}

PatchFilterResult PatchFilter::filter(const cv::Mat& mask,
                                      const cv::Size& imageSize,
                                      const std::vector<PatchCoordinate>& coords,
                                      const PatchFilterOptions& options,
                                      std::mt19937& rng)
{
    PatchFilterResult result;
    result.totalCoords = static_cast<int>(coords.size());
    result.records.reserve(coords.size());

    const int p = options.patchSize;
    double coverageSum = 0.0;

    for (const PatchCoordinate& coord : coords) {
        // Only degenerate inputs (image smaller than a patch, mask smaller than image) land here
        if (!fits(coord, p, imageSize) || !fits(coord, p, mask.size())) {
            continue;
        }

        PatchRecord record;
        record.coord = coord;
        record.coverage = coverageRatio(mask(cv::Rect(coord.x, coord.y, p, p)));
        record.keep = !options.applyMinMaskRatio || record.coverage >= options.minMaskRatio;

        coverageSum += record.coverage;
        if (record.keep) {
            result.kept.push_back(coord);
        }
        result.records.push_back(record);
    }

    if (!result.records.empty()) {
        result.coverageMean = coverageSum / static_cast<double>(result.records.size());
    }

    if (options.maxPatches > 0 && static_cast<int>(result.kept.size()) > options.maxPatches) {
        std::shuffle(result.kept.begin(), result.kept.end(), rng);
        result.kept.resize(static_cast<size_t>(options.maxPatches));
        std::sort(result.kept.begin(), result.kept.end());
    }

    return result;
}
