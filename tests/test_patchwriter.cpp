#include <gtest/gtest.h>
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <stdexcept>
#include "imageiohelper.h"
#include "patchwriter.h"
#include "testutils.h"

TEST(PatchWriterTest, FileNameEncodesOrigin)
{
    EXPECT_EQ(PatchWriter::patchFileName("img1", PatchCoordinate(0, 0), "png"), QString("img1_y0_x0.png"));
    EXPECT_EQ(PatchWriter::patchFileName("img1", PatchCoordinate(0, 256), "png"), QString("img1_y0_x256.png"));
    EXPECT_EQ(PatchWriter::patchFileName("scan.v2", PatchCoordinate(44, 7), "tif"), QString("scan.v2_y44_x7.tif"));
}

TEST(PatchWriterTest, EnsureDirectoriesIsIdempotent)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString imageDir = QDir(tmp.path()).filePath("out/Image");
    const QString maskDir = QDir(tmp.path()).filePath("out/Mask");

    PatchWriter writer(imageDir, maskDir, "png");
    EXPECT_EQ(writer.imageDir(), imageDir);
    EXPECT_EQ(writer.maskDir(), maskDir);
    EXPECT_NO_THROW(writer.ensureDirectories());
    EXPECT_NO_THROW(writer.ensureDirectories());
    EXPECT_TRUE(QFileInfo(imageDir).isDir());
    EXPECT_TRUE(QFileInfo(maskDir).isDir());
}

TEST(PatchWriterTest, WritesImageAndScaledMaskCrops)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString imageDir = QDir(tmp.path()).filePath("Image");
    const QString maskDir = QDir(tmp.path()).filePath("Mask");
    PatchWriter writer(imageDir, maskDir, "png");
    writer.ensureDirectories();

    cv::Mat image = testutils::makeImage(32, 64);
    cv::Mat mask = cv::Mat::zeros(32, 64, CV_8UC1);
    mask(cv::Rect(32, 0, 32, 32)).setTo(1);

    std::vector<PatchCoordinate> coords = {PatchCoordinate(0, 0), PatchCoordinate(0, 32)};
    EXPECT_EQ(writer.writePatches(image, mask, "img1", coords, 32), 2);

    EXPECT_EQ(testutils::fileNames(imageDir),
              QStringList() << "img1_y0_x0.png" << "img1_y0_x32.png");
    EXPECT_EQ(testutils::fileNames(maskDir),
              QStringList() << "img1_y0_x0.png" << "img1_y0_x32.png");

    cv::Mat imagePatch = ImageIOHelper::imreadUnicode(QDir(imageDir).filePath("img1_y0_x32.png"));
    ASSERT_FALSE(imagePatch.empty());
    EXPECT_EQ(imagePatch.size(), cv::Size(32, 32));
    EXPECT_EQ(cv::norm(imagePatch, image(cv::Rect(32, 0, 32, 32)), cv::NORM_INF), 0.0);

    cv::Mat emptyMask = ImageIOHelper::imreadUnicode(QDir(maskDir).filePath("img1_y0_x0.png"),
                                                     cv::IMREAD_GRAYSCALE);
    cv::Mat fullMask = ImageIOHelper::imreadUnicode(QDir(maskDir).filePath("img1_y0_x32.png"),
                                                    cv::IMREAD_GRAYSCALE);
    ASSERT_FALSE(emptyMask.empty());
    ASSERT_FALSE(fullMask.empty());
    EXPECT_EQ(cv::countNonZero(emptyMask), 0);
    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(fullMask, &minVal, &maxVal);
    EXPECT_EQ(minVal, 255.0);
    EXPECT_EQ(maxVal, 255.0);
}

TEST(PatchWriterTest, JpegOutputUsesFormatSuffix)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    PatchWriter writer(tmp.path() + "/Image", tmp.path() + "/Mask", "jpg");
    writer.ensureDirectories();

    cv::Mat image = testutils::makeImage(16, 16);
    cv::Mat mask = cv::Mat::ones(16, 16, CV_8UC1);
    EXPECT_EQ(writer.writePatches(image, mask, "a", {PatchCoordinate(0, 0)}, 16), 1);
    EXPECT_TRUE(QFileInfo(tmp.path() + "/Image/a_y0_x0.jpg").isFile());
    EXPECT_TRUE(QFileInfo(tmp.path() + "/Mask/a_y0_x0.jpg").isFile());
}

TEST(PatchWriterTest, MissingDirectoryThrows)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    PatchWriter writer(tmp.path() + "/missing/Image", tmp.path() + "/missing/Mask", "png");

    cv::Mat image = testutils::makeImage(16, 16);
    cv::Mat mask = cv::Mat::ones(16, 16, CV_8UC1);
    EXPECT_THROW(writer.writePatches(image, mask, "a", {PatchCoordinate(0, 0)}, 16),
                 std::runtime_error);
}
