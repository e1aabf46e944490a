#ifndef EXTRACTIONOBSERVER_H
#define EXTRACTIONOBSERVER_H

#include <QString>
#include <opencv2/opencv.hpp>
#include "jobstatistics.h"

/**
 * Receiver of ExtractionRunner notifications
 *
 * All callbacks run on the runner's worker thread. Progress, statistics and
 * preview of a pair arrive after the pair is written and before the next one
 * starts; onFinished() arrives exactly once, last. Implementations that feed
 * a GUI must hand the data over to their own thread.
 */
class ExtractionObserver
{
public:
    virtual ~ExtractionObserver() = default;

    /**
     * @param percent floor(100 * processed / pairs), 0..100
     */
    virtual void onProgress(int percent) = 0;

    /**
     * @param stats Cumulative statistics after the latest pair
     */
    virtual void onStatistics(const JobStatistics& stats) = 0;

    /**
     * Most recently processed pair, not sent during a dry run
     * @param image Source image (BGR)
     * @param mask Binary mask (0/1)
     */
    virtual void onPreview(const cv::Mat& image, const cv::Mat& mask) = 0;

    /**
     * @param success true only when every pair was processed
     * @param message Outcome description
     */
    virtual void onFinished(bool success, const QString& message) = 0;
};

#endif // EXTRACTIONOBSERVER_H
