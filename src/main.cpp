#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QDebug>
#include <QLoggingCategory>
#include <csignal>
#include <functional>
#include <memory>
#include "configmanager.h"
#include "extractionconfig.h"
#include "extractionrunner.h"

namespace {

volatile std::sig_atomic_t g_cancelRequested = 0;
volatile std::sig_atomic_t g_pauseRequested = 0;
volatile std::sig_atomic_t g_resumeRequested = 0;

extern "C" void handleCancelSignal(int)
{
    g_cancelRequested = 1;
}

#ifdef SIGUSR1
extern "C" void handlePauseSignal(int)
{
    g_pauseRequested = 1;
}

extern "C" void handleResumeSignal(int)
{
    g_resumeRequested = 1;
}
#endif

/**
 * Prints runner notifications to the log
 */
class ConsoleObserver : public ExtractionObserver
{
public:
    void onProgress(int percent) override
    {
        if (percent != m_lastPercent) {
            m_lastPercent = percent;
            qInfo().noquote() << QString("Progress: %1%").arg(percent);
        }
    }

    void onStatistics(const JobStatistics& stats) override
    {
        qInfo().noquote() << QString("Pairs %1/%2, patches %3 (last pair: %4 candidates, mean coverage %5)")
                                 .arg(stats.processed)
                                 .arg(stats.pairs)
                                 .arg(stats.patchesTotal)
                                 .arg(stats.lastPair.totalCoords)
                                 .arg(stats.lastPair.coverageMean, 0, 'f', 3);
    }

    void onPreview(const cv::Mat& image, const cv::Mat& mask) override
    {
        qDebug() << "Preview" << image.cols << "x" << image.rows
                 << "foreground pixels:" << cv::countNonZero(mask);
    }

    void onFinished(bool success, const QString& message) override
    {
        // The runner logs the outcome message itself
        Q_UNUSED(message);
        qDebug() << "Job finished, success:" << success;
    }

private:
    int m_lastPercent = -1;
};

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Patch Extractor");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("PatchExtractor");

    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss} [%{type}] %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Tile image/mask pairs into fixed-size patches.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption dataRootOption("data-root", "Source root holding the image and mask folders.", "dir");
    QCommandLineOption patchRootOption("patch-root", "Destination root for the patches.", "dir");
    QCommandLineOption patchSizeOption("patch-size", "Patch side length in pixels.", "pixels");
    QCommandLineOption strideOption("stride", "Grid step in pixels.", "pixels");
    QCommandLineOption minRatioOption("min-mask-ratio", "Minimum mask coverage in [0, 1].", "ratio");
    QCommandLineOption maxPatchesOption("max-patches", "Maximum patches per image, 0 = unlimited.", "count");
    QCommandLineOption formatOption("format", "Output format: png, jpg or tif.", "format");
    QCommandLineOption seedOption("seed", "Random seed for patch sampling.", "seed");
    QCommandLineOption extensionsOption("extensions", "Comma separated file globs, e.g. *.png,*.jpg.", "globs");
    QCommandLineOption noBordersOption("no-borders", "Do not add edge-aligned patches.");
    QCommandLineOption noRatioOption("no-ratio-filter", "Keep patches regardless of mask coverage.");
    QCommandLineOption dryRunOption("dry-run", "Count pairs without writing files.");
    QCommandLineOption configOption("config", "Load the configuration from a JSON file.", "file");
    QCommandLineOption useLastOption("use-last", "Start from the configuration of the previous run.");
    QCommandLineOption imageFolderOption("image-folder", "Name of the image folder (saved).", "name");
    QCommandLineOption maskFolderOption("mask-folder", "Name of the mask folder (saved).", "name");
    QCommandLineOption settingsOption("settings", "Use an INI settings file instead of the system store.", "file");
    QCommandLineOption verboseOption("verbose", "Print debug output.");

    parser.addOptions({dataRootOption, patchRootOption, patchSizeOption, strideOption,
                       minRatioOption, maxPatchesOption, formatOption, seedOption,
                       extensionsOption, noBordersOption, noRatioOption, dryRunOption,
                       configOption, useLastOption, imageFolderOption, maskFolderOption,
                       settingsOption, verboseOption});
    parser.process(app);

    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    std::unique_ptr<ConfigManager> configManager;
    if (parser.isSet(settingsOption)) {
        configManager = std::make_unique<ConfigManager>(parser.value(settingsOption));
    } else {
        configManager = std::make_unique<ConfigManager>();
    }
    qDebug().noquote() << "Settings:" << configManager->fileName();

    if (parser.isSet(imageFolderOption)) {
        configManager->setImageFolderName(parser.value(imageFolderOption));
    }
    if (parser.isSet(maskFolderOption)) {
        configManager->setMaskFolderName(parser.value(maskFolderOption));
    }

    ExtractionConfig base;
    if (parser.isSet(useLastOption)) {
        base = configManager->loadLastConfig();
    }

    if (parser.isSet(configOption)) {
        QFile file(parser.value(configOption));
        if (!file.open(QIODevice::ReadOnly)) {
            qCritical().noquote() << "Cannot open configuration file" << file.fileName();
            return 1;
        }
        bool ok = false;
        QString error;
        base = ExtractionConfig::fromJson(file.readAll(), &ok, &error);
        if (!ok) {
            qCritical().noquote() << "Invalid configuration file:" << error;
            return 1;
        }
    }

    ExtractionConfig::Builder builder(base);
    bool numbersOk = true;

    auto intOption = [&](const QCommandLineOption& option, std::function<void(int)> apply) {
        if (!parser.isSet(option)) {
            return;
        }
        bool ok = false;
        int value = parser.value(option).toInt(&ok);
        if (!ok) {
            qCritical().noquote() << "Expected an integer for --" + option.names().first()
                                  << "got" << parser.value(option);
            numbersOk = false;
            return;
        }
        apply(value);
    };

    if (parser.isSet(dataRootOption)) {
        builder.setDataRoot(parser.value(dataRootOption));
    }
    if (parser.isSet(patchRootOption)) {
        builder.setPatchRoot(parser.value(patchRootOption));
    }
    intOption(patchSizeOption, [&](int v) { builder.setPatchSize(v); });
    intOption(strideOption, [&](int v) { builder.setStride(v); });
    intOption(maxPatchesOption, [&](int v) { builder.setMaxPatchesPerImage(v); });
    intOption(seedOption, [&](int v) { builder.setSeed(v); });
    if (parser.isSet(minRatioOption)) {
        bool ok = false;
        double ratio = parser.value(minRatioOption).toDouble(&ok);
        if (!ok) {
            qCritical().noquote() << "Expected a number for --min-mask-ratio, got"
                                  << parser.value(minRatioOption);
            numbersOk = false;
        } else {
            builder.setMinMaskRatio(ratio);
        }
    }
    if (!numbersOk) {
        return 1;
    }

    if (parser.isSet(formatOption)) {
        builder.setSaveFormat(parser.value(formatOption).toLower());
    }
    if (parser.isSet(extensionsOption)) {
        QStringList patterns;
        const QStringList parts = parser.value(extensionsOption).split(',');
        for (const QString& part : parts) {
            patterns.append(part.trimmed());
        }
        builder.setImageExtensions(patterns);
    }
    if (parser.isSet(noBordersOption)) {
        builder.setIncludeBorders(false);
    }
    if (parser.isSet(noRatioOption)) {
        builder.setApplyMinMaskRatio(false);
    }
    if (parser.isSet(dryRunOption)) {
        builder.setDryRun(true);
    }

    const ExtractionConfig config = builder.build();
    ConfigValidation validation = config.validate();
    if (!validation.isValid()) {
        qCritical().noquote() << "Invalid configuration:" << validation.message;
        return 1;
    }
    configManager->saveLastConfig(config);

    std::signal(SIGINT, handleCancelSignal);
    std::signal(SIGTERM, handleCancelSignal);
#ifdef SIGUSR1
    std::signal(SIGUSR1, handlePauseSignal);
    std::signal(SIGUSR2, handleResumeSignal);
#endif

    ConsoleObserver observer;
    ExtractionRunner runner(config, configManager->datasetLayout(), &observer);
    runner.startJob();

    while (!runner.wait(100)) {
        if (g_cancelRequested) {
            g_cancelRequested = 0;
            runner.cancel();
        }
        if (g_pauseRequested) {
            g_pauseRequested = 0;
            runner.pause();
        }
        if (g_resumeRequested) {
            g_resumeRequested = 0;
            runner.resume();
        }
    }

    const RunnerState finalState = runner.state();
    qDebug().noquote() << "Runner state:" << ExtractionRunner::stateName(finalState);
    return finalState == RunnerState::Completed ? 0 : 2;
}
