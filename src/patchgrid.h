#ifndef PATCHGRID_H
#define PATCHGRID_H

#include <vector>

/**
 * Top-left corner of a square patch, in pixels
 */
struct PatchCoordinate {
    int y;
    int x;

    PatchCoordinate() : y(0), x(0) {}
    PatchCoordinate(int row, int col) : y(row), x(col) {}

    bool operator<(const PatchCoordinate& other) const
    {
        return y < other.y || (y == other.y && x < other.x);
    }

    bool operator==(const PatchCoordinate& other) const
    {
        return y == other.y && x == other.x;
    }
};

/**
 * Generates the patch origins covering an image
 */
class PatchGrid
{
public:
    /**
     * Generate patch origins on a stride-spaced grid
     *
     * The base grid steps by stride while the patch fits. An image smaller
     * than the patch still yields the origin (0, 0). With includeBorders, a
     * trailing row at y = height - patchSize and a trailing column at
     * x = width - patchSize are added when the grid does not reach the edge.
     * @param height Image height
     * @param width Image width
     * @param patchSize Patch side length (> 0)
     * @param stride Grid step (> 0)
     * @param includeBorders Add edge-aligned patches
     * @return Unique origins sorted by (y, x)
     * @throws std::invalid_argument on non-positive patch size or stride, or negative dimensions
     */
    static std::vector<PatchCoordinate> generateCoordinates(int height, int width,
                                                            int patchSize, int stride,
                                                            bool includeBorders);

private:
    // Origins 0, stride, 2*stride, ... below max(1, extent - patchSize + 1)
    static std::vector<int> axisOrigins(int extent, int patchSize, int stride);
};

#endif // PATCHGRID_H
