#include "patchextractor.h"
#include "imageiohelper.h"
#include <QDebug>
#include <stdexcept>

PairResult PatchExtractor::extractPair(const ImageMaskPair& pair,
                                       const PatchWriter& writer,
                                       const PairOptions& options,
                                       std::mt19937& rng)
{
    PairResult result;

    result.image = ImageIOHelper::imreadUnicode(pair.imagePath, cv::IMREAD_COLOR);
    if (result.image.empty()) {
        throw std::runtime_error("Failed to read image: " + pair.imagePath.toStdString());
    }

    result.mask = ImageIOHelper::readBinaryMask(pair.maskPath);
    if (result.mask.empty()) {
        throw std::runtime_error("Failed to read mask: " + pair.maskPath.toStdString());
    }

    if (result.mask.size() != result.image.size()) {
        qWarning() << "PatchExtractor: mask size" << result.mask.cols << "x" << result.mask.rows
                   << "differs from image size" << result.image.cols << "x" << result.image.rows
                   << "for" << pair.imagePath;
    }

    const int patchSize = options.filter.patchSize;
    std::vector<PatchCoordinate> coords = PatchGrid::generateCoordinates(
        result.image.rows, result.image.cols, patchSize, options.stride, options.includeBorders);

    PatchFilterResult filtered = PatchFilter::filter(result.mask, result.image.size(), coords,
                                                     options.filter, rng);

    if (filtered.records.size() < coords.size()) {
        qDebug() << "PatchExtractor: dropped" << (coords.size() - filtered.records.size())
                 << "out-of-bounds candidates for" << pair.imagePath;
    }

    const QString stem = PairingResolver::stemOf(pair.imagePath);
    result.written = writer.writePatches(result.image, result.mask, stem, filtered.kept, patchSize);

    result.stats.totalCoords = filtered.totalCoords;
    result.stats.kept = static_cast<int>(filtered.kept.size());
    result.stats.coverageMean = filtered.coverageMean;

    return result;
}
