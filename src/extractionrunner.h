#ifndef EXTRACTIONRUNNER_H
#define EXTRACTIONRUNNER_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QString>
#include <random>
#include "extractionconfig.h"
#include "extractionobserver.h"
#include "jobstatistics.h"
#include "pairingresolver.h"

enum class RunnerState {
    Idle,
    Running,
    Paused,
    Completed,
    Cancelled,
    Failed
};

/**
 * Background worker that extracts patches from every pair of a dataset
 *
 * The job runs once, sequentially, on the runner's own thread. Pause and
 * cancel requests are honoured between pairs only.
 */
class ExtractionRunner : public QThread
{
    Q_OBJECT

public:
    /**
     * @param config Job configuration (copied)
     * @param layout Image/mask folder names below the roots
     * @param observer Receiver of notifications, not owned, may be nullptr
     * @param parent Qt parent
     */
    ExtractionRunner(const ExtractionConfig& config,
                     const DatasetLayout& layout,
                     ExtractionObserver* observer,
                     QObject *parent = nullptr);
    ~ExtractionRunner();

    /**
     * Start the job on the worker thread (Idle -> Running)
     * @return false if the runner was already started
     */
    bool startJob();

    /**
     * Request a pause at the next pair boundary
     */
    void pause();

    /**
     * Continue a paused job
     */
    void resume();

    /**
     * Request cancellation at the next pair boundary
     *
     * Patches of pairs already processed stay on disk.
     */
    void cancel();

    /**
     * Current state
     */
    RunnerState state() const;

    /**
     * Snapshot of the cumulative statistics
     */
    JobStatistics statistics() const;

    /**
     * Outcome message once a terminal state is reached
     */
    QString finalMessage() const;

    static QString stateName(RunnerState state);

protected:
    void run() override;

private:
    /**
     * Execute the job, returning the terminal state and its message
     */
    RunnerState executeJob(QString& message);

    /**
     * Block at a pair boundary while paused
     * @return false if the job was cancelled
     */
    bool waitAtPairBoundary();

    bool isFinishedState() const;
    void publishPair(const JobStatistics& stats, const cv::Mat& image, const cv::Mat& mask);

    const ExtractionConfig m_config;
    const DatasetLayout m_layout;
    ExtractionObserver* m_observer;

    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    bool m_shouldPause;
    bool m_shouldCancel;
    RunnerState m_state;
    JobStatistics m_stats;
    QString m_finalMessage;

    std::mt19937 m_rng;
};

#endif // EXTRACTIONRUNNER_H
