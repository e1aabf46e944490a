#include <gtest/gtest.h>
#include <QFile>
#include <QFileInfo>
#include "pairingresolver.h"
#include "testutils.h"

namespace {

const QStringList kPatterns = QStringList() << "*.png" << "*.jpg" << "*.bmp";

QStringList names(const std::vector<ImageMaskPair>& pairs, bool masks)
{
    QStringList result;
    for (const ImageMaskPair& pair : pairs) {
        result.append(QFileInfo(masks ? pair.maskPath : pair.imagePath).fileName());
    }
    return result;
}

} // namespace

TEST(PairingResolverTest, UnmatchedImagesAreExcluded)
{
    testutils::Dataset data;
    ASSERT_TRUE(data.isValid());
    ASSERT_TRUE(data.addImage("a.png", 8, 8));
    ASSERT_TRUE(data.addImage("b.png", 8, 8));
    ASSERT_TRUE(data.addMask("a.png", 8, 8));

    auto pairs = PairingResolver::resolvePairs(data.imageDir(), data.maskDir(), kPatterns);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(QFileInfo(pairs[0].imagePath).fileName(), QString("a.png"));
    EXPECT_EQ(QFileInfo(pairs[0].maskPath).fileName(), QString("a.png"));
}

TEST(PairingResolverTest, MatchesAcrossExtensionsSortedByImage)
{
    testutils::Dataset data;
    ASSERT_TRUE(data.addImage("c.jpg", 8, 8));
    ASSERT_TRUE(data.addImage("a.png", 8, 8));
    ASSERT_TRUE(data.addImage("b.bmp", 8, 8));
    ASSERT_TRUE(data.addMask("a.bmp", 8, 8));
    ASSERT_TRUE(data.addMask("b.png", 8, 8));
    ASSERT_TRUE(data.addMask("c.png", 8, 8));

    auto pairs = PairingResolver::resolvePairs(data.imageDir(), data.maskDir(), kPatterns);
    EXPECT_EQ(names(pairs, false), QStringList() << "a.png" << "b.bmp" << "c.jpg");
    EXPECT_EQ(names(pairs, true), QStringList() << "a.bmp" << "b.png" << "c.png");
}

TEST(PairingResolverTest, PatternsLimitEnumeratedFiles)
{
    testutils::Dataset data;
    ASSERT_TRUE(data.addPair("a", 8, 8));
    ASSERT_TRUE(data.addPair("b", 8, 8, cv::Rect(), "jpg"));

    auto pairs = PairingResolver::resolvePairs(data.imageDir(), data.maskDir(),
                                               QStringList() << "*.png");
    EXPECT_EQ(names(pairs, false), QStringList() << "a.png");
    EXPECT_EQ(PairingResolver::countImages(data.imageDir(), QStringList() << "*.png"), 1);
    EXPECT_EQ(PairingResolver::countImages(data.imageDir(), kPatterns), 2);
}

TEST(PairingResolverTest, PatternsMatchCaseSensitively)
{
    testutils::Dataset data;
    auto touch = [](const QString& path) {
        QFile file(path);
        return file.open(QIODevice::WriteOnly);
    };
    ASSERT_TRUE(touch(QDir(data.imageDir()).filePath("upper.PNG")));
    ASSERT_TRUE(touch(QDir(data.maskDir()).filePath("upper.PNG")));
    ASSERT_TRUE(data.addPair("lower", 8, 8));

    auto pairs = PairingResolver::resolvePairs(data.imageDir(), data.maskDir(),
                                               QStringList() << "*.png");
    EXPECT_EQ(names(pairs, false), QStringList() << "lower.png");
    EXPECT_EQ(PairingResolver::countImages(data.imageDir(), QStringList() << "*.png"), 1);
    EXPECT_EQ(PairingResolver::countImages(data.imageDir(), QStringList() << "*.PNG"), 1);
}

TEST(PairingResolverTest, DuplicateMaskStemPicksGreatestPath)
{
    testutils::Dataset data;
    ASSERT_TRUE(data.addImage("a.png", 8, 8));
    ASSERT_TRUE(data.addMask("a.bmp", 8, 8));
    ASSERT_TRUE(data.addMask("a.png", 8, 8));
    ASSERT_TRUE(data.addMask("a.jpg", 8, 8));

    auto pairs = PairingResolver::resolvePairs(data.imageDir(), data.maskDir(), kPatterns);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(QFileInfo(pairs[0].maskPath).fileName(), QString("a.png"));
}

TEST(PairingResolverTest, DuplicateImageStemUsesFirstImage)
{
    testutils::Dataset data;
    ASSERT_TRUE(data.addImage("a.png", 8, 8));
    ASSERT_TRUE(data.addImage("a.jpg", 8, 8));
    ASSERT_TRUE(data.addMask("a.png", 8, 8));

    auto pairs = PairingResolver::resolvePairs(data.imageDir(), data.maskDir(), kPatterns);
    EXPECT_EQ(names(pairs, false), QStringList() << "a.jpg");
}

TEST(PairingResolverTest, MissingDirectoriesGiveNoPairs)
{
    testutils::Dataset data;
    auto pairs = PairingResolver::resolvePairs(data.dataRoot() + "/nope", data.maskDir(), kPatterns);
    EXPECT_TRUE(pairs.empty());
    EXPECT_EQ(PairingResolver::countImages(data.dataRoot() + "/nope", kPatterns), 0);
}

TEST(PairingResolverTest, StemKeepsInnerDots)
{
    EXPECT_EQ(PairingResolver::stemOf("/data/Image/scan.v2.png"), QString("scan.v2"));
    EXPECT_EQ(PairingResolver::stemOf("plain.jpg"), QString("plain"));
}
