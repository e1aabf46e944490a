#ifndef TESTUTILS_H
#define TESTUTILS_H

#include <QDir>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <opencv2/opencv.hpp>
#include <functional>
#include <vector>
#include "extractionobserver.h"

namespace testutils {

/**
 * Deterministic 3-channel test image
 */
inline cv::Mat makeImage(int height, int width)
{
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x % 256),
                                                  static_cast<uchar>(y % 256),
                                                  static_cast<uchar>((x + y) % 256));
        }
    }
    return image;
}

/**
 * Mask with value 255 inside foreground and 0 elsewhere
 */
inline cv::Mat makeMask(int height, int width, const cv::Rect& foreground = cv::Rect())
{
    cv::Mat mask = cv::Mat::zeros(height, width, CV_8UC1);
    if (foreground.area() > 0) {
        mask(foreground).setTo(255);
    }
    return mask;
}

inline bool writeImage(const QString& path, const cv::Mat& image)
{
    return cv::imwrite(path.toStdString(), image);
}

inline int countFiles(const QString& dirPath)
{
    QDir dir(dirPath);
    if (!dir.exists()) {
        return 0;
    }
    return static_cast<int>(dir.entryList(QDir::Files).size());
}

inline QStringList fileNames(const QString& dirPath)
{
    QStringList names = QDir(dirPath).entryList(QDir::Files);
    names.sort();
    return names;
}

/**
 * Temporary dataset with <root>/data/{Image,Mask} and <root>/patches
 */
class Dataset
{
public:
    Dataset()
    {
        QDir root(m_tempDir.path());
        root.mkpath("data/Image");
        root.mkpath("data/Mask");
    }

    bool isValid() const { return m_tempDir.isValid(); }

    QString dataRoot() const { return QDir(m_tempDir.path()).filePath("data"); }
    QString patchRoot() const { return QDir(m_tempDir.path()).filePath("patches"); }
    QString imageDir() const { return QDir(dataRoot()).filePath("Image"); }
    QString maskDir() const { return QDir(dataRoot()).filePath("Mask"); }
    QString outImageDir() const { return QDir(patchRoot()).filePath("Image"); }
    QString outMaskDir() const { return QDir(patchRoot()).filePath("Mask"); }

    bool addPair(const QString& stem, int height, int width,
                 const cv::Rect& foreground = cv::Rect(), const QString& ext = "png")
    {
        return addImage(stem + "." + ext, height, width)
            && addMask(stem + "." + ext, height, width, foreground);
    }

    bool addImage(const QString& fileName, int height, int width)
    {
        return writeImage(QDir(imageDir()).filePath(fileName), makeImage(height, width));
    }

    bool addMask(const QString& fileName, int height, int width,
                 const cv::Rect& foreground = cv::Rect())
    {
        return writeImage(QDir(maskDir()).filePath(fileName), makeMask(height, width, foreground));
    }

private:
    QTemporaryDir m_tempDir;
};

/**
 * Observer that records every notification
 */
class RecordingObserver : public ExtractionObserver
{
public:
    std::function<void(int)> progressHook;

    void onProgress(int percent) override
    {
        {
            QMutexLocker locker(&m_mutex);
            m_events.append("progress");
            m_progress.push_back(percent);
        }
        if (progressHook) {
            progressHook(percent);
        }
    }

    void onStatistics(const JobStatistics& stats) override
    {
        QMutexLocker locker(&m_mutex);
        m_events.append("stats");
        m_stats.push_back(stats);
    }

    void onPreview(const cv::Mat& image, const cv::Mat& mask) override
    {
        QMutexLocker locker(&m_mutex);
        m_events.append("preview");
        m_previewSizes.push_back(image.size());
        m_lastPreviewMask = mask.clone();
    }

    void onFinished(bool success, const QString& message) override
    {
        QMutexLocker locker(&m_mutex);
        m_events.append("done");
        m_finishedCount++;
        m_success = success;
        m_message = message;
    }

    QStringList events() const { QMutexLocker locker(&m_mutex); return m_events; }
    std::vector<int> progress() const { QMutexLocker locker(&m_mutex); return m_progress; }
    std::vector<JobStatistics> stats() const { QMutexLocker locker(&m_mutex); return m_stats; }
    int previewCount() const { QMutexLocker locker(&m_mutex); return static_cast<int>(m_previewSizes.size()); }
    cv::Mat lastPreviewMask() const { QMutexLocker locker(&m_mutex); return m_lastPreviewMask; }
    int finishedCount() const { QMutexLocker locker(&m_mutex); return m_finishedCount; }
    bool success() const { QMutexLocker locker(&m_mutex); return m_success; }
    QString message() const { QMutexLocker locker(&m_mutex); return m_message; }

private:
    mutable QMutex m_mutex;
    QStringList m_events;
    std::vector<int> m_progress;
    std::vector<JobStatistics> m_stats;
    std::vector<cv::Size> m_previewSizes;
    cv::Mat m_lastPreviewMask;
    int m_finishedCount = 0;
    bool m_success = false;
    QString m_message;
};

} // namespace testutils

#endif // TESTUTILS_H
