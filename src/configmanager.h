#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include "extractionconfig.h"

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Use the platform settings store of the application
     */
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file instead of the platform settings store
     * @param settingsFile Path to the INI file
     */
    explicit ConfigManager(const QString& settingsFile, QObject *parent = nullptr);

    /**
     * Load the configuration of the previous run
     *
     * A missing or unreadable entry yields the default configuration.
     * @return Last saved configuration, or the defaults
     */
    ExtractionConfig loadLastConfig();

    /**
     * Check whether a previous configuration was saved
     */
    bool hasLastConfig() const;

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveLastConfig(const ExtractionConfig& config);

    /**
     * Folder names used below the data and patch roots
     */
    DatasetLayout datasetLayout() const;

    void setImageFolderName(const QString& name);
    void setMaskFolderName(const QString& name);

    /**
     * Path of the backing store, for diagnostics
     */
    QString fileName() const;

private:
    void initDefaults();

    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_LAST_CONFIG;
    static const QString KEY_IMAGE_FOLDER;
    static const QString KEY_MASK_FOLDER;
};

#endif // CONFIGMANAGER_H
