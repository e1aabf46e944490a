#include "patchgrid.h"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>

std::vector<PatchCoordinate> PatchGrid::generateCoordinates(int height, int width,
                                                            int patchSize, int stride,
                                                            bool includeBorders)
{
    if (patchSize <= 0 || stride <= 0) {
        throw std::invalid_argument("patch size and stride must be > 0 (got "
                                    + std::to_string(patchSize) + ", "
                                    + std::to_string(stride) + ")");
    }
    if (height < 0 || width < 0) {
        throw std::invalid_argument("image dimensions must not be negative");
    }

    const std::vector<int> rows = axisOrigins(height, patchSize, stride);
    const std::vector<int> cols = axisOrigins(width, patchSize, stride);

    std::set<PatchCoordinate> coords;
    for (int y : rows) {
        for (int x : cols) {
            coords.insert(PatchCoordinate(y, x));
        }
    }

    if (includeBorders) {
        // Bottom strip the stride grid does not reach
        if (height > patchSize && (height - patchSize) % stride != 0) {
            for (int x : cols) {
                coords.insert(PatchCoordinate(height - patchSize, x));
            }
        }
        // Right strip
        if (width > patchSize && (width - patchSize) % stride != 0) {
            for (int y : rows) {
                coords.insert(PatchCoordinate(y, width - patchSize));
            }
        }
    }

    return std::vector<PatchCoordinate>(coords.begin(), coords.end());
}

std::vector<int> PatchGrid::axisOrigins(int extent, int patchSize, int stride)
{
    std::vector<int> origins;
    const int limit = std::max(1, extent - patchSize + 1);
    for (int v = 0; v < limit; v += stride) {
        origins.push_back(v);
    }
    return origins;
}
