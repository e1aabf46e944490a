#include "configmanager.h"
#include <QDebug>

// Configuration keys
const QString ConfigManager::KEY_LAST_CONFIG = "last_config";
const QString ConfigManager::KEY_IMAGE_FOLDER = "app/image_folder_name";
const QString ConfigManager::KEY_MASK_FOLDER = "app/mask_folder_name";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("PatchExtractor", "PatchExtractor", this);
    initDefaults();
}

ConfigManager::ConfigManager(const QString& settingsFile, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(settingsFile, QSettings::IniFormat, this);
    initDefaults();
}

void ConfigManager::initDefaults()
{
    DatasetLayout defaults;
    if (m_settings->value(KEY_IMAGE_FOLDER).toString().isEmpty()) {
        m_settings->setValue(KEY_IMAGE_FOLDER, defaults.imageFolderName);
    }
    if (m_settings->value(KEY_MASK_FOLDER).toString().isEmpty()) {
        m_settings->setValue(KEY_MASK_FOLDER, defaults.maskFolderName);
    }
}

ExtractionConfig ConfigManager::loadLastConfig()
{
    QString json = m_settings->value(KEY_LAST_CONFIG).toString();
    if (json.isEmpty()) {
        return ExtractionConfig();
    }

    bool ok = false;
    QString error;
    ExtractionConfig config = ExtractionConfig::fromJson(json.toUtf8(), &ok, &error);
    if (!ok) {
        qWarning() << "ConfigManager: ignoring stored configuration:" << error;
        return ExtractionConfig();
    }

    return config;
}

bool ConfigManager::hasLastConfig() const
{
    return !m_settings->value(KEY_LAST_CONFIG).toString().isEmpty();
}

void ConfigManager::saveLastConfig(const ExtractionConfig& config)
{
    m_settings->setValue(KEY_LAST_CONFIG, QString::fromUtf8(config.toJson()));
    m_settings->sync();
}

DatasetLayout ConfigManager::datasetLayout() const
{
    DatasetLayout defaults;
    return DatasetLayout(
        m_settings->value(KEY_IMAGE_FOLDER, defaults.imageFolderName).toString(),
        m_settings->value(KEY_MASK_FOLDER, defaults.maskFolderName).toString());
}

void ConfigManager::setImageFolderName(const QString& name)
{
    m_settings->setValue(KEY_IMAGE_FOLDER, name);
    m_settings->sync();
}

void ConfigManager::setMaskFolderName(const QString& name)
{
    m_settings->setValue(KEY_MASK_FOLDER, name);
    m_settings->sync();
}

QString ConfigManager::fileName() const
{
    return m_settings->fileName();
}
