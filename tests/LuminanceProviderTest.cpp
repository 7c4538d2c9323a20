#include <gtest/gtest.h>
#include <QTemporaryDir>
#include "Hasher.h"
#include "ImageHash.h"
#include "LuminanceProvider.h"
#include "TestImages.h"
#ifdef HAVE_OPENCV
#include "OpenCvProvider.h"
#endif

using namespace PHash;

namespace {

TEST(LuminanceProviderTest, DecodesAndResizes) {
    QImage img(64, 64, QImage::Format_RGB32);
    img.fill(Qt::black);
    for (int y = 0; y < 64; ++y)
        for (int x = 0; x < 32; ++x)
            img.setPixel(x, y, qRgb(255, 255, 255));

    LuminanceGrid grid;
    QString why;
    ASSERT_TRUE(QImageProvider().load(ImageSource::fromData(fixtures::encodePng(img)), 32, &grid, &why))
        << why.toStdString();
    ASSERT_EQ(grid.size(), 32);
    EXPECT_GT(grid.at(0, 0), 200.0);
    EXPECT_LT(grid.at(31, 31), 50.0);
}

TEST(LuminanceProviderTest, GarbageIsRejected) {
    LuminanceGrid grid;
    QString why;
    EXPECT_FALSE(QImageProvider().load(ImageSource::fromData("not an image"), 32, &grid, &why));
    EXPECT_FALSE(why.isEmpty());
    EXPECT_TRUE(grid.isNull());
}

TEST(LuminanceProviderTest, ChainFromNames) {
    HashError error;
    const auto chain = ProviderChain::create({"qimage"}, &error);
    ASSERT_TRUE(chain);
    EXPECT_EQ(chain->names(), QStringList{"qimage"});
    EXPECT_TRUE(ProviderChain::availableBackends().contains("qimage"));
}

TEST(LuminanceProviderTest, UnknownBackendIsConfigurationError) {
    HashError error;
    EXPECT_FALSE(ProviderChain::create({"qimage", "imlib2"}, &error));
    EXPECT_EQ(error.error, HashError::ConfigurationError);
    EXPECT_FALSE(ProviderChain::create({}, &error));
    EXPECT_EQ(error.error, HashError::ConfigurationError);
}

TEST(LuminanceProviderTest, ChainFailureIsSourceUnavailable) {
    const auto chain = ProviderChain::create(ProviderChain::availableBackends());
    ASSERT_TRUE(chain);
    HashError error;
    EXPECT_TRUE(chain->load(ImageSource::fromData("garbage"), 32, &error).isNull());
    EXPECT_EQ(error.error, HashError::SourceUnavailableError);
}

TEST(LuminanceProviderTest, FileAndMemorySourcesAgree) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QImage img = fixtures::samplePicture();
    const QString path = dir.filePath("sample.png");
    ASSERT_TRUE(img.save(path));

    Hasher fromFile(ImageSource::fromFile(path));
    Hasher fromData(ImageSource::fromData(fixtures::encodePng(img)));
    EXPECT_EQ(fromFile.computeHash(), fromData.computeHash());
    EXPECT_FALSE(fromFile.computeHash().isNull());
}

TEST(LuminanceProviderTest, MirroredPictureUnderMirrorproof) {
    const QImage img = fixtures::samplePicture();
    Hasher original(ImageSource::fromData(fixtures::encodePng(img)));
    Hasher flipped(ImageSource::fromData(fixtures::encodePng(img.mirrored(true, false))));

    HashConfig c = HashConfig::reducedSquare(8);
    c.mirrorproof = true;
    EXPECT_LE(hammingDistance(original.computeHash(c).toHex(), flipped.computeHash(c).toHex()), 4);

    HashConfig m = HashConfig::reducedSquare(8);
    m.mirror = true;
    EXPECT_LE(hammingDistance(original.computeHash(m).toHex(),
                              flipped.computeHash(HashConfig::reducedSquare(8)).toHex()), 4);
}

#ifdef HAVE_OPENCV
TEST(LuminanceProviderTest, OpenCvDecodesFileAndMemory) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QImage img = fixtures::samplePicture();
    const QString path = dir.filePath("sample.png");
    ASSERT_TRUE(img.save(path));

    const OpenCvProvider provider;
    LuminanceGrid fromData, fromFile;
    QString why;
    ASSERT_TRUE(provider.load(ImageSource::fromData(fixtures::encodePng(img)), 32, &fromData, &why))
        << why.toStdString();
    ASSERT_TRUE(provider.load(ImageSource::fromFile(path), 32, &fromFile, &why))
        << why.toStdString();
    EXPECT_EQ(fromData.size(), 32);
    EXPECT_EQ(fromData, fromFile);

    // top left block is white in the sample
    EXPECT_GT(fromData.at(5, 5), 200.0);
}

TEST(LuminanceProviderTest, OpenCvRejectsGarbage) {
    LuminanceGrid grid;
    QString why;
    EXPECT_FALSE(OpenCvProvider().load(ImageSource::fromData("not an image"), 32, &grid, &why));
    EXPECT_FALSE(why.isEmpty());
    EXPECT_TRUE(grid.isNull());

    EXPECT_FALSE(OpenCvProvider().load(ImageSource::fromFile("/nonexistent/sample.png"), 32, &grid, &why));
    EXPECT_FALSE(why.isEmpty());
}
#endif

}
