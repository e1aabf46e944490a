#ifndef PAIRINGRESOLVER_H
#define PAIRINGRESOLVER_H

#include <QString>
#include <QStringList>
#include <vector>

/**
 * An image file and the mask file sharing its stem
 */
struct ImageMaskPair {
    QString imagePath;
    QString maskPath;

    ImageMaskPair() = default;
    ImageMaskPair(const QString& image, const QString& mask) :
        imagePath(image),
        maskPath(mask)
    {}

    bool operator==(const ImageMaskPair& other) const
    {
        return imagePath == other.imagePath && maskPath == other.maskPath;
    }
};

/**
 * Matches image files to mask files by filename stem
 */
class PairingResolver
{
public:
    /**
     * Build the list of image/mask pairs of a dataset
     *
     * Files are matched by stem only, so "a.jpg" pairs with "a.png".
     * Images without a mask are skipped. When several masks share a stem the
     * one with the lexicographically greatest path wins. When several images
     * share a stem only the first one (by path) is used.
     * @param imagesDir Directory holding the source images
     * @param masksDir Directory holding the masks
     * @param patterns File name globs, e.g. "*.png"
     * @return Pairs sorted by image path, empty if nothing matched
     */
    static std::vector<ImageMaskPair> resolvePairs(const QString& imagesDir,
                                                   const QString& masksDir,
                                                   const QStringList& patterns);

    /**
     * Count the files in a directory matching the patterns
     * @param imagesDir Directory to scan
     * @param patterns File name globs
     * @return Number of matching files, 0 if the directory does not exist
     */
    static int countImages(const QString& imagesDir, const QStringList& patterns);

    /**
     * File name without its last suffix ("a.b.png" -> "a.b")
     */
    static QString stemOf(const QString& path);

private:
    /**
     * List matching regular files, sorted by absolute path
     */
    static QStringList listFiles(const QString& dirPath, const QStringList& patterns);
};

#endif // PAIRINGRESOLVER_H
