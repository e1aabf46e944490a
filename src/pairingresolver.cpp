#include "pairingresolver.h"
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QSet>
#include <QDebug>

std::vector<ImageMaskPair> PairingResolver::resolvePairs(const QString& imagesDir,
                                                         const QString& masksDir,
                                                         const QStringList& patterns)
{
    std::vector<ImageMaskPair> pairs;

    const QStringList imagePaths = listFiles(imagesDir, patterns);
    const QStringList maskPaths = listFiles(masksDir, patterns);

    // Sorted input, so the last mask of a stem is the greatest path
    QHash<QString, QString> maskIndex;
    for (const QString& maskPath : maskPaths) {
        QString stem = stemOf(maskPath);
        if (maskIndex.contains(stem)) {
            qDebug() << "PairingResolver: mask" << maskPath << "replaces" << maskIndex.value(stem);
        }
        maskIndex.insert(stem, maskPath);
    }

    QSet<QString> usedStems;
    for (const QString& imagePath : imagePaths) {
        QString stem = stemOf(imagePath);
        if (!maskIndex.contains(stem)) {
            continue;
        }
        if (usedStems.contains(stem)) {
            qWarning() << "PairingResolver: skipping" << imagePath
                       << "- another image already uses the stem" << stem;
            continue;
        }
        usedStems.insert(stem);
        pairs.emplace_back(imagePath, maskIndex.value(stem));
    }

    return pairs;
}

int PairingResolver::countImages(const QString& imagesDir, const QStringList& patterns)
{
    return static_cast<int>(listFiles(imagesDir, patterns).size());
}

QString PairingResolver::stemOf(const QString& path)
{
    return QFileInfo(path).completeBaseName();
}

QStringList PairingResolver::listFiles(const QString& dirPath, const QStringList& patterns)
{
    QStringList files;

    QDir dir(dirPath);
    if (dirPath.isEmpty() || !dir.exists()) {
        return files;
    }

    // Patterns match the exact case, "*.png" does not pick up "A.PNG"
    const QFileInfoList entries = dir.entryInfoList(patterns,
                                                    QDir::Files | QDir::NoDotAndDotDot | QDir::CaseSensitive,
                                                    QDir::NoSort);
    for (const QFileInfo& entry : entries) {
        files.append(entry.absoluteFilePath());
    }

    files.removeDuplicates();
    files.sort();
    return files;
}
