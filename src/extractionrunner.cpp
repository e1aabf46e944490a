#include "extractionrunner.h"
#include "patchextractor.h"
#include "patchwriter.h"
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <stdexcept>

ExtractionRunner::ExtractionRunner(const ExtractionConfig& config,
                                   const DatasetLayout& layout,
                                   ExtractionObserver* observer,
                                   QObject *parent)
    : QThread(parent),
      m_config(config),
      m_layout(layout),
      m_observer(observer),
      m_shouldPause(false),
      m_shouldCancel(false),
      m_state(RunnerState::Idle)
{
}

ExtractionRunner::~ExtractionRunner()
{
    cancel();
    wait();
}

bool ExtractionRunner::startJob()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != RunnerState::Idle) {
            return false;
        }
        m_state = RunnerState::Running;
    }

    start();
    return true;
}

void ExtractionRunner::pause()
{
    QMutexLocker locker(&m_mutex);
    if (m_shouldPause || isFinishedState()) {
        return;
    }
    m_shouldPause = true;
    qInfo() << "Pause requested, holding after the current pair";
}

void ExtractionRunner::resume()
{
    QMutexLocker locker(&m_mutex);
    if (!m_shouldPause) {
        return;
    }
    m_shouldPause = false;
    m_condition.wakeAll();
    qInfo() << "Resumed";
}

void ExtractionRunner::cancel()
{
    QMutexLocker locker(&m_mutex);
    if (m_shouldCancel || isFinishedState()) {
        return;
    }
    m_shouldCancel = true;
    m_condition.wakeAll();
    qInfo() << "Cancel requested";
}

RunnerState ExtractionRunner::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

JobStatistics ExtractionRunner::statistics() const
{
    QMutexLocker locker(&m_mutex);
    return m_stats;
}

QString ExtractionRunner::finalMessage() const
{
    QMutexLocker locker(&m_mutex);
    return m_finalMessage;
}

// Callers hold m_mutex
bool ExtractionRunner::isFinishedState() const
{
    return m_state == RunnerState::Completed
        || m_state == RunnerState::Cancelled
        || m_state == RunnerState::Failed;
}

QString ExtractionRunner::stateName(RunnerState state)
{
    switch (state) {
        case RunnerState::Idle:
            return "Idle";
        case RunnerState::Running:
            return "Running";
        case RunnerState::Paused:
            return "Paused";
        case RunnerState::Completed:
            return "Completed";
        case RunnerState::Cancelled:
            return "Cancelled";
        case RunnerState::Failed:
            return "Failed";
        default:
            return "Unknown";
    }
}

void ExtractionRunner::run()
{
    QString message;
    RunnerState finalState = executeJob(message);

    {
        QMutexLocker locker(&m_mutex);
        m_state = finalState;
        m_finalMessage = message;
    }

    if (finalState == RunnerState::Failed) {
        qWarning().noquote() << message;
    } else {
        qInfo().noquote() << message;
    }

    if (m_observer) {
        m_observer->onFinished(finalState == RunnerState::Completed, message);
    }
}

RunnerState ExtractionRunner::executeJob(QString& message)
{
    {
        QMutexLocker locker(&m_mutex);
        m_stats.reset();
    }

    ConfigValidation validation = m_config.validate();
    if (!validation.isValid()) {
        message = QString("Invalid configuration: %1").arg(validation.message);
        return RunnerState::Failed;
    }

    try {
        // One stream per job keeps multi-pair sampling reproducible
        m_rng.seed(static_cast<std::mt19937::result_type>(m_config.seed()));

        const QDir dataRoot(m_config.dataRoot());
        const QDir patchRoot(m_config.patchRoot());
        const QString imagesDir = dataRoot.filePath(m_layout.imageFolderName);
        const QString masksDir = dataRoot.filePath(m_layout.maskFolderName);

        const std::vector<ImageMaskPair> pairs =
            PairingResolver::resolvePairs(imagesDir, masksDir, m_config.imageExtensions());

        JobStatistics stats;
        stats.images = PairingResolver::countImages(imagesDir, m_config.imageExtensions());
        stats.pairs = static_cast<int>(pairs.size());
        {
            QMutexLocker locker(&m_mutex);
            m_stats = stats;
        }

        if (pairs.empty()) {
            message = "No pairs to process.";
            return RunnerState::Failed;
        }

        PatchWriter writer(patchRoot.filePath(m_layout.imageFolderName),
                           patchRoot.filePath(m_layout.maskFolderName),
                           m_config.saveFormat());
        if (!m_config.dryRun()) {
            writer.ensureDirectories();
            qInfo() << "Writing patches to" << writer.imageDir() << "and" << writer.maskDir();
        }

        PairOptions options;
        options.stride = m_config.stride();
        options.includeBorders = m_config.includeBorders();
        options.filter.patchSize = m_config.patchSize();
        options.filter.minMaskRatio = m_config.minMaskRatio();
        options.filter.applyMinMaskRatio = m_config.applyMinMaskRatio();
        options.filter.maxPatches = m_config.maxPatchesPerImage();

        qInfo() << "Starting on" << stats.pairs << "pairs"
                << (m_config.dryRun() ? "(dry run)" : "");

        for (const ImageMaskPair& pair : pairs) {
            if (!waitAtPairBoundary()) {
                message = "Cancelled.";
                return RunnerState::Cancelled;
            }

            PairResult result;
            if (m_config.dryRun()) {
                result.stats = PairStatistics::notComputed();
            } else {
                result = PatchExtractor::extractPair(pair, writer, options, m_rng);
            }

            stats.processed++;
            stats.patchesTotal += result.written;
            stats.keptLast = result.written;
            stats.lastPair = result.stats;
            {
                QMutexLocker locker(&m_mutex);
                m_stats = stats;
            }

            publishPair(stats, result.image, result.mask);

            qInfo().noquote() << QString("Processed %1 -> kept %2 patches")
                                     .arg(QFileInfo(pair.imagePath).fileName())
                                     .arg(result.written);
        }

        if (m_config.dryRun()) {
            message = QString("Dry run complete. Pairs: %1").arg(stats.pairs);
        } else {
            message = QString("Done. Total patches: %1").arg(stats.patchesTotal);
        }
        return RunnerState::Completed;

    } catch (const std::exception& e) {
        message = QString("Error: %1").arg(QString::fromUtf8(e.what()));
        return RunnerState::Failed;
    }
}

bool ExtractionRunner::waitAtPairBoundary()
{
    QMutexLocker locker(&m_mutex);

    while (m_shouldPause && !m_shouldCancel) {
        m_state = RunnerState::Paused;
        m_condition.wait(&m_mutex);
    }

    if (m_shouldCancel) {
        return false;
    }

    m_state = RunnerState::Running;
    return true;
}

void ExtractionRunner::publishPair(const JobStatistics& stats, const cv::Mat& image, const cv::Mat& mask)
{
    if (!m_observer) {
        return;
    }

    int percent = static_cast<int>((100LL * stats.processed) / stats.pairs);
    m_observer->onProgress(percent);
    m_observer->onStatistics(stats);
    if (!image.empty() && !mask.empty()) {
        m_observer->onPreview(image, mask);
    }
}
