#ifndef PATCHWRITER_H
#define PATCHWRITER_H

#include <QString>
#include <opencv2/opencv.hpp>
#include <vector>
#include "patchgrid.h"

/**
 * Crops kept patches and writes them to the destination folders
 *
 * Image and mask crops of one origin share the file name
 * "{stem}_y{Y}_x{X}.{format}", so the source position can be read back
 * from the name.
 */
class PatchWriter
{
public:
    /**
     * @param imageDir Destination folder for image patches
     * @param maskDir Destination folder for mask patches
     * @param saveFormat File format suffix ("png", "jpg" or "tif")
     */
    PatchWriter(const QString& imageDir, const QString& maskDir, const QString& saveFormat);

    /**
     * Create both destination folders if they are missing
     * @throws std::runtime_error if a folder cannot be created
     */
    void ensureDirectories() const;

    /**
     * Write the image and mask patches of the given origins
     * @param image Source image (3 channels)
     * @param mask Binary source mask (CV_8UC1, 0/1), written as 0/255
     * @param stem File name stem of the source image
     * @param coords Origins to write, each must lie inside image and mask
     * @param patchSize Patch side length
     * @return Number of patches written
     * @throws std::runtime_error if encoding or writing a file fails
     */
    int writePatches(const cv::Mat& image, const cv::Mat& mask, const QString& stem,
                     const std::vector<PatchCoordinate>& coords, int patchSize) const;

    /**
     * File name of a patch, e.g. "img1_y0_x256.png"
     */
    static QString patchFileName(const QString& stem, const PatchCoordinate& coord,
                                 const QString& saveFormat);

    const QString& imageDir() const { return m_imageDir; }
    const QString& maskDir() const { return m_maskDir; }

private:
    void writeFile(const QString& filePath, const cv::Mat& data) const;

    QString m_imageDir;
    QString m_maskDir;
    QString m_saveFormat;
    std::vector<int> m_encodeParams;

    static constexpr int JPEG_QUALITY = 95;
};

#endif // PATCHWRITER_H
