#include "extractionconfig.h"
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <cmath>
#include <limits>

namespace {

// JSON keys
const QString KEY_DATA_ROOT = "data_root";
const QString KEY_PATCH_ROOT = "patch_root";
const QString KEY_PATCH_SIZE = "patch_size";
const QString KEY_STRIDE = "stride";
const QString KEY_MIN_MASK_RATIO = "min_mask_ratio";
const QString KEY_MAX_PATCHES = "max_patches_per_image";
const QString KEY_SAVE_FORMAT = "save_format";
const QString KEY_SEED = "seed";
const QString KEY_INCLUDE_BORDERS = "include_borders";
const QString KEY_APPLY_MIN_MASK_RATIO = "apply_min_mask_ratio";
const QString KEY_DRY_RUN = "dry_run";
const QString KEY_IMAGE_EXTENSIONS = "image_extensions";

QString typeError(const QString& key, const char* expected)
{
    return QString("'%1' must be %2").arg(key, QString::fromLatin1(expected));
}

bool readString(const QJsonObject& obj, const QString& key, QString& value, QString& error)
{
    if (!obj.contains(key)) {
        return true;
    }
    QJsonValue v = obj.value(key);
    if (!v.isString()) {
        error = typeError(key, "a string");
        return false;
    }
    value = v.toString();
    return true;
}

bool readInt(const QJsonObject& obj, const QString& key, int& value, QString& error)
{
    if (!obj.contains(key)) {
        return true;
    }
    QJsonValue v = obj.value(key);
    double d = v.toDouble();
    if (!v.isDouble() || d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()
        || d != std::floor(d)) {
        error = typeError(key, "an integer");
        return false;
    }
    value = static_cast<int>(d);
    return true;
}

bool readDouble(const QJsonObject& obj, const QString& key, double& value, QString& error)
{
    if (!obj.contains(key)) {
        return true;
    }
    QJsonValue v = obj.value(key);
    if (!v.isDouble()) {
        error = typeError(key, "a number");
        return false;
    }
    value = v.toDouble();
    return true;
}

bool readBool(const QJsonObject& obj, const QString& key, bool& value, QString& error)
{
    if (!obj.contains(key)) {
        return true;
    }
    QJsonValue v = obj.value(key);
    if (!v.isBool()) {
        error = typeError(key, "a boolean");
        return false;
    }
    value = v.toBool();
    return true;
}

bool readStringList(const QJsonObject& obj, const QString& key, QStringList& value, QString& error)
{
    if (!obj.contains(key)) {
        return true;
    }
    QJsonValue v = obj.value(key);
    if (!v.isArray()) {
        error = typeError(key, "a list of strings");
        return false;
    }
    QStringList list;
    const QJsonArray array = v.toArray();
    for (const QJsonValue& item : array) {
        if (!item.isString()) {
            error = typeError(key, "a list of strings");
            return false;
        }
        list.append(item.toString());
    }
    value = list;
    return true;
}

} // namespace

ExtractionConfig::ExtractionConfig() :
    m_patchSize(256),
    m_stride(256),
    m_minMaskRatio(0.0),
    m_maxPatchesPerImage(0),
    m_saveFormat("png"),
    m_seed(123),
    m_includeBorders(true),
    m_applyMinMaskRatio(true),
    m_dryRun(false),
    m_imageExtensions(defaultImageExtensions())
{
}

QStringList ExtractionConfig::supportedFormats()
{
    return QStringList() << "png" << "jpg" << "tif";
}

QStringList ExtractionConfig::defaultImageExtensions()
{
    return QStringList() << "*.jpg" << "*.jpeg" << "*.png" << "*.bmp";
}

ConfigValidation ExtractionConfig::validate() const
{
    if (m_dataRoot.isEmpty() || !QFileInfo(m_dataRoot).isDir()) {
        return ConfigValidation(ConfigError::InvalidDataRoot, "Invalid data_root");
    }
    if (m_patchRoot.isEmpty()) {
        return ConfigValidation(ConfigError::MissingPatchRoot, "patch_root is required");
    }
    if (m_patchSize <= 0 || m_stride <= 0) {
        return ConfigValidation(ConfigError::NonPositiveGeometry,
                                "patch_size and stride must be > 0");
    }
    if (m_imageExtensions.isEmpty()) {
        return ConfigValidation(ConfigError::InvalidExtensions,
                                "image_extensions must not be empty");
    }
    for (const QString& pattern : m_imageExtensions) {
        if (pattern.trimmed().isEmpty()) {
            return ConfigValidation(ConfigError::InvalidExtensions,
                                    "image_extensions must be a list of non-empty strings");
        }
    }
    if (!supportedFormats().contains(m_saveFormat)) {
        return ConfigValidation(ConfigError::UnsupportedFormat, "Unsupported save format");
    }
    if (!(m_minMaskRatio >= 0.0 && m_minMaskRatio <= 1.0)) {
        return ConfigValidation(ConfigError::InvalidMaskRatio,
                                "min_mask_ratio must be between 0 and 1");
    }
    if (m_maxPatchesPerImage < 0) {
        return ConfigValidation(ConfigError::InvalidPatchLimit,
                                "max_patches_per_image must be >= 0");
    }
    return ConfigValidation();
}

QByteArray ExtractionConfig::toJson() const
{
    QJsonObject root;
    root.insert(KEY_DATA_ROOT, m_dataRoot);
    root.insert(KEY_PATCH_ROOT, m_patchRoot);
    root.insert(KEY_PATCH_SIZE, m_patchSize);
    root.insert(KEY_STRIDE, m_stride);
    root.insert(KEY_MIN_MASK_RATIO, m_minMaskRatio);
    root.insert(KEY_MAX_PATCHES, m_maxPatchesPerImage);
    root.insert(KEY_SAVE_FORMAT, m_saveFormat);
    root.insert(KEY_SEED, m_seed);
    root.insert(KEY_INCLUDE_BORDERS, m_includeBorders);
    root.insert(KEY_APPLY_MIN_MASK_RATIO, m_applyMinMaskRatio);
    root.insert(KEY_DRY_RUN, m_dryRun);
    root.insert(KEY_IMAGE_EXTENSIONS, QJsonArray::fromStringList(m_imageExtensions));

    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

ExtractionConfig ExtractionConfig::fromJson(const QByteArray& json, bool* ok, QString* errorMessage)
{
    ExtractionConfig config;
    QString error;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        error = QString("JSON parse error: %1").arg(parseError.errorString());
    } else if (!doc.isObject()) {
        error = "Root is not a JSON object";
    } else {
        QJsonObject root = doc.object();
        bool parsed = readString(root, KEY_DATA_ROOT, config.m_dataRoot, error)
                && readString(root, KEY_PATCH_ROOT, config.m_patchRoot, error)
                && readInt(root, KEY_PATCH_SIZE, config.m_patchSize, error)
                && readInt(root, KEY_STRIDE, config.m_stride, error)
                && readDouble(root, KEY_MIN_MASK_RATIO, config.m_minMaskRatio, error)
                && readInt(root, KEY_MAX_PATCHES, config.m_maxPatchesPerImage, error)
                && readString(root, KEY_SAVE_FORMAT, config.m_saveFormat, error)
                && readInt(root, KEY_SEED, config.m_seed, error)
                && readBool(root, KEY_INCLUDE_BORDERS, config.m_includeBorders, error)
                && readBool(root, KEY_APPLY_MIN_MASK_RATIO, config.m_applyMinMaskRatio, error)
                && readBool(root, KEY_DRY_RUN, config.m_dryRun, error)
                && readStringList(root, KEY_IMAGE_EXTENSIONS, config.m_imageExtensions, error);
        if (!parsed) {
            config = ExtractionConfig();
        }
    }

    if (ok) {
        *ok = error.isEmpty();
    }
    if (errorMessage) {
        *errorMessage = error;
    }
    return config;
}

bool ExtractionConfig::operator==(const ExtractionConfig& other) const
{
    return m_dataRoot == other.m_dataRoot
        && m_patchRoot == other.m_patchRoot
        && m_patchSize == other.m_patchSize
        && m_stride == other.m_stride
        && m_minMaskRatio == other.m_minMaskRatio
        && m_maxPatchesPerImage == other.m_maxPatchesPerImage
        && m_saveFormat == other.m_saveFormat
        && m_seed == other.m_seed
        && m_includeBorders == other.m_includeBorders
        && m_applyMinMaskRatio == other.m_applyMinMaskRatio
        && m_dryRun == other.m_dryRun
        && m_imageExtensions == other.m_imageExtensions;
}
