#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QString>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>
#include <opencv2/opencv.hpp>
#include <cstring>
#include <vector>

/**
 * Helper functions for Unicode-safe image I/O
 *
 * OpenCV's cv::imwrite() and cv::imread() do not support Unicode paths on Windows.
 * These helpers use cv::imencode()/cv::imdecode() with Qt's file APIs
 * so dataset folders with non-ASCII names work on all platforms.
 */
class ImageIOHelper
{
public:
    /**
     * Write an image to disk with Unicode path support
     * @param filePath Path to save the image, the suffix selects the encoder
     * @param image OpenCV Mat to save
     * @param params Encoder parameters (e.g., JPEG quality)
     * @return true if successful, false otherwise
     */
    static bool imwriteUnicode(const QString& filePath, const cv::Mat& image,
                               const std::vector<int>& params = std::vector<int>())
    {
        if (image.empty()) {
            return false;
        }

        QString suffix = QFileInfo(filePath).suffix().toLower();
        if (suffix.isEmpty()) {
            suffix = "png";
        }

        std::vector<uchar> buffer;
        if (!cv::imencode("." + suffix.toStdString(), image, buffer, params)) {
            return false;
        }

        QFile file(filePath);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }

        qint64 written = file.write(reinterpret_cast<const char*>(buffer.data()),
                                    static_cast<qint64>(buffer.size()));
        file.close();

        return written == static_cast<qint64>(buffer.size());
    }

    /**
     * Read an image from disk with Unicode path support
     * @param filePath Path to read the image from (supports Unicode)
     * @param flags OpenCV imread flags (e.g., cv::IMREAD_COLOR)
     * @return OpenCV Mat (empty if failed)
     */
    static cv::Mat imreadUnicode(const QString& filePath, int flags = cv::IMREAD_COLOR)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            return cv::Mat();
        }

        QByteArray fileData = file.readAll();
        file.close();

        if (fileData.isEmpty()) {
            return cv::Mat();
        }

        std::vector<uchar> buffer(fileData.begin(), fileData.end());
        return cv::imdecode(buffer, flags);
    }

    /**
     * Read the palette indices of an indexed-colour image
     *
     * cv::imdecode() expands a palette to BGR, which loses the class index
     * a label mask stores in each pixel. Qt reports the stored format before
     * decoding, so palette PNG and BMP files are read through QImage instead.
     * @param filePath Path to the image file
     * @return CV_8UC1 Mat of palette indices (empty if the file has no palette)
     */
    static cv::Mat readPaletteIndices(const QString& filePath)
    {
        QImageReader reader(filePath);
        const QImage::Format format = reader.imageFormat();
        if (format != QImage::Format_Indexed8
            && format != QImage::Format_Mono
            && format != QImage::Format_MonoLSB) {
            return cv::Mat();
        }

        QImage image = reader.read();
        if (image.isNull()) {
            return cv::Mat();
        }
        // 1-bit palettes keep their indices when widened
        image = image.convertToFormat(QImage::Format_Indexed8);

        cv::Mat indices(image.height(), image.width(), CV_8UC1);
        for (int y = 0; y < image.height(); y++) {
            std::memcpy(indices.ptr(y), image.constScanLine(y), static_cast<size_t>(image.width()));
        }
        return indices;
    }

    /**
     * Read a mask as a binary single-channel 0/1 image
     *
     * Palette masks are thresholded on their index, so every non-zero class
     * counts as foreground whatever its colour. Other multi-channel masks use
     * their first channel in RGB order (the red channel). Any non-zero value
     * counts as foreground.
     * @param filePath Path to the mask file
     * @return CV_8UC1 Mat with values 0 and 1 (empty if failed)
     */
    static cv::Mat readBinaryMask(const QString& filePath)
    {
        cv::Mat channel = readPaletteIndices(filePath);

        if (channel.empty()) {
            cv::Mat raw = imreadUnicode(filePath, cv::IMREAD_UNCHANGED);
            if (raw.empty()) {
                return cv::Mat();
            }

            if (raw.channels() >= 3) {
                cv::extractChannel(raw, channel, 2);  // BGR(A) storage, red is index 2
            } else if (raw.channels() == 2) {
                cv::extractChannel(raw, channel, 0);
            } else {
                channel = raw;
            }
        }

        cv::Mat foreground;
        cv::compare(channel, cv::Scalar::all(0), foreground, cv::CMP_GT);

        // compare() yields 0/255
        cv::Mat binary;
        foreground.convertTo(binary, CV_8U, 1.0 / 255.0);
        return binary;
    }
};

#endif // IMAGEIOHELPER_H
