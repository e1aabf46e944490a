#ifndef EXTRACTIONCONFIG_H
#define EXTRACTIONCONFIG_H

#include <QString>
#include <QStringList>
#include <QByteArray>

/**
 * Reason a configuration was rejected
 */
enum class ConfigError {
    None,
    InvalidDataRoot,
    MissingPatchRoot,
    NonPositiveGeometry,
    InvalidExtensions,
    UnsupportedFormat,
    InvalidMaskRatio,
    InvalidPatchLimit
};

/**
 * Result of ExtractionConfig::validate()
 */
struct ConfigValidation {
    ConfigError error;
    QString message;

    ConfigValidation() : error(ConfigError::None) {}
    ConfigValidation(ConfigError err, const QString& msg) : error(err), message(msg) {}

    bool isValid() const { return error == ConfigError::None; }
};

/**
 * Names of the image and mask subdirectories below the source and
 * destination roots
 */
struct DatasetLayout {
    QString imageFolderName;
    QString maskFolderName;

    DatasetLayout() :
        imageFolderName("Image"),
        maskFolderName("Mask")
    {}

    DatasetLayout(const QString& imageFolder, const QString& maskFolder) :
        imageFolderName(imageFolder),
        maskFolderName(maskFolder)
    {}
};

/**
 * Parameters of one patch extraction job
 *
 * Instances are immutable, use ExtractionConfig::Builder to create a
 * modified copy.
 */
class ExtractionConfig
{
public:
    class Builder;

    /**
     * Default configuration (patch 256, stride 256, png, seed 123)
     */
    ExtractionConfig();

    const QString& dataRoot() const { return m_dataRoot; }
    const QString& patchRoot() const { return m_patchRoot; }
    int patchSize() const { return m_patchSize; }
    int stride() const { return m_stride; }
    double minMaskRatio() const { return m_minMaskRatio; }
    int maxPatchesPerImage() const { return m_maxPatchesPerImage; }
    const QString& saveFormat() const { return m_saveFormat; }
    int seed() const { return m_seed; }
    bool includeBorders() const { return m_includeBorders; }
    bool applyMinMaskRatio() const { return m_applyMinMaskRatio; }
    bool dryRun() const { return m_dryRun; }
    const QStringList& imageExtensions() const { return m_imageExtensions; }

    /**
     * Check the configuration before a job starts
     * @return ConfigValidation with ConfigError::None, or the first failed rule
     */
    ConfigValidation validate() const;

    /**
     * Serialize to an indented JSON object
     * @return UTF-8 JSON text
     */
    QByteArray toJson() const;

    /**
     * Parse a JSON object produced by toJson()
     *
     * Missing keys keep their default value, unknown keys are ignored.
     * @param json JSON text
     * @param ok Set to false on malformed JSON or a wrongly typed value
     * @param errorMessage Receives the reason on failure (may be nullptr)
     * @return Parsed configuration, or the defaults on failure
     */
    static ExtractionConfig fromJson(const QByteArray& json, bool* ok,
                                     QString* errorMessage = nullptr);

    /**
     * Formats accepted by the patch writer
     */
    static QStringList supportedFormats();

    static QStringList defaultImageExtensions();

    bool operator==(const ExtractionConfig& other) const;
    bool operator!=(const ExtractionConfig& other) const { return !(*this == other); }

private:
    QString m_dataRoot;
    QString m_patchRoot;
    int m_patchSize;
    int m_stride;
    double m_minMaskRatio;
    int m_maxPatchesPerImage;
    QString m_saveFormat;
    int m_seed;
    bool m_includeBorders;
    bool m_applyMinMaskRatio;
    bool m_dryRun;
    QStringList m_imageExtensions;
};

/**
 * Builder for ExtractionConfig
 *
 * Starts from the defaults, or from an existing configuration.
 */
class ExtractionConfig::Builder
{
public:
    Builder() = default;
    explicit Builder(const ExtractionConfig& base) : m_config(base) {}

    Builder& setDataRoot(const QString& path) { m_config.m_dataRoot = path; return *this; }
    Builder& setPatchRoot(const QString& path) { m_config.m_patchRoot = path; return *this; }
    Builder& setPatchSize(int size) { m_config.m_patchSize = size; return *this; }
    Builder& setStride(int stride) { m_config.m_stride = stride; return *this; }
    Builder& setMinMaskRatio(double ratio) { m_config.m_minMaskRatio = ratio; return *this; }
    Builder& setMaxPatchesPerImage(int count) { m_config.m_maxPatchesPerImage = count; return *this; }
    Builder& setSaveFormat(const QString& format) { m_config.m_saveFormat = format; return *this; }
    Builder& setSeed(int seed) { m_config.m_seed = seed; return *this; }
    Builder& setIncludeBorders(bool enabled) { m_config.m_includeBorders = enabled; return *this; }
    Builder& setApplyMinMaskRatio(bool enabled) { m_config.m_applyMinMaskRatio = enabled; return *this; }
    Builder& setDryRun(bool enabled) { m_config.m_dryRun = enabled; return *this; }
    Builder& setImageExtensions(const QStringList& patterns) { m_config.m_imageExtensions = patterns; return *this; }

    ExtractionConfig build() const { return m_config; }

private:
    ExtractionConfig m_config;
};

#endif // EXTRACTIONCONFIG_H
