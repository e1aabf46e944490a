#include "patchwriter.h"
#include "imageiohelper.h"
#include <QDir>
#include <stdexcept>

PatchWriter::PatchWriter(const QString& imageDir, const QString& maskDir, const QString& saveFormat)
    : m_imageDir(imageDir),
      m_maskDir(maskDir),
      m_saveFormat(saveFormat)
{
    if (m_saveFormat == "jpg") {
        m_encodeParams.push_back(cv::IMWRITE_JPEG_QUALITY);
        m_encodeParams.push_back(JPEG_QUALITY);
    }
}

void PatchWriter::ensureDirectories() const
{
    QDir dir;
    if (!dir.mkpath(m_imageDir)) {
        throw std::runtime_error("Failed to create output directory: " + m_imageDir.toStdString());
    }
    if (!dir.mkpath(m_maskDir)) {
        throw std::runtime_error("Failed to create output directory: " + m_maskDir.toStdString());
    }
}

QString PatchWriter::patchFileName(const QString& stem, const PatchCoordinate& coord,
                                   const QString& saveFormat)
{
    return QString("%1_y%2_x%3.%4").arg(stem).arg(coord.y).arg(coord.x).arg(saveFormat);
}

int PatchWriter::writePatches(const cv::Mat& image, const cv::Mat& mask, const QString& stem,
                              const std::vector<PatchCoordinate>& coords, int patchSize) const
{
    const QDir imageDir(m_imageDir);
    const QDir maskDir(m_maskDir);

    int written = 0;
    for (const PatchCoordinate& coord : coords) {
        const cv::Rect roi(coord.x, coord.y, patchSize, patchSize);
        const QString fileName = patchFileName(stem, coord, m_saveFormat);

        writeFile(imageDir.filePath(fileName), image(roi));

        cv::Mat maskPatch;
        mask(roi).convertTo(maskPatch, CV_8U, 255.0);
        writeFile(maskDir.filePath(fileName), maskPatch);

        written++;
    }

    return written;
}

void PatchWriter::writeFile(const QString& filePath, const cv::Mat& data) const
{
    if (!ImageIOHelper::imwriteUnicode(filePath, data, m_encodeParams)) {
        throw std::runtime_error("Failed to write patch: " + filePath.toStdString());
    }
}
