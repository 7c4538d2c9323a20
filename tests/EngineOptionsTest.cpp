#include <gtest/gtest.h>
#include <QSettings>
#include <QTemporaryDir>
#include "EngineOptions.h"

using namespace PHash;

namespace {

class EngineOptionsTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(m_dir.isValid()); }

    QString writeIni(const QVariantMap& values) {
        const QString path = m_dir.filePath("phash.ini");
        QFile::remove(path);
        QSettings s(path, QSettings::IniFormat);
        for (auto it = values.constBegin(); it != values.constEnd(); ++it)
            s.setValue("phash/" + it.key(), it.value());
        s.sync();
        return path;
    }

    QTemporaryDir m_dir;
};

TEST_F(EngineOptionsTest, Defaults) {
    const EngineOptions o;
    EXPECT_EQ(o.resizeSize, 32);
    EXPECT_EQ(o.defaultConfig.geometry, Geometry::square(8));
    EXPECT_EQ(o.defaultConfig.method, Method::Average);
    EXPECT_FALSE(o.defaultConfig.reduce);
    EXPECT_EQ(o.backends.first(), "qimage");
    EXPECT_TRUE(o.validate());
}

TEST_F(EngineOptionsTest, ReadsSettings) {
    const QSettings s(writeIni({{"resize", 64}, {"geometry", "7x7"}, {"reduce", true},
                                {"method", "median"}, {"mirrorproof", true},
                                {"backends", QStringList{"qimage"}}}),
                      QSettings::IniFormat);
    HashError error;
    const EngineOptions o = EngineOptions::fromSettings(s, &error);
    EXPECT_EQ(error.error, HashError::NoError) << error.errorString().toStdString();
    EXPECT_EQ(o.resizeSize, 64);
    EXPECT_EQ(o.defaultConfig, HashConfig([] {
        HashConfig c = HashConfig::reducedSquare(7, Method::Median);
        c.mirrorproof = true;
        return c;
    }()));
    EXPECT_EQ(o.backends, QStringList{"qimage"});
}

TEST_F(EngineOptionsTest, BadGeometryIsConfigurationError) {
    const QSettings s(writeIni({{"geometry", "8x9"}}), QSettings::IniFormat);
    HashError error;
    EngineOptions::fromSettings(s, &error);
    EXPECT_EQ(error.error, HashError::ConfigurationError);
}

TEST_F(EngineOptionsTest, BadMethodIsConfigurationError) {
    const QSettings s(writeIni({{"method", "fancy"}}), QSettings::IniFormat);
    HashError error;
    EngineOptions::fromSettings(s, &error);
    EXPECT_EQ(error.error, HashError::ConfigurationError);
}

TEST_F(EngineOptionsTest, ConflictingMirrorFlags) {
    const QSettings s(writeIni({{"mirror", true}, {"mirrorproof", true}}), QSettings::IniFormat);
    HashError error;
    EngineOptions::fromSettings(s, &error);
    EXPECT_EQ(error.error, HashError::ConfigurationError);
}

TEST_F(EngineOptionsTest, GeometryLargerThanGrid) {
    const QSettings s(writeIni({{"resize", 8}, {"geometry", "9x9"}}), QSettings::IniFormat);
    HashError error;
    EngineOptions::fromSettings(s, &error);
    EXPECT_EQ(error.error, HashError::ConfigurationError);
}

TEST_F(EngineOptionsTest, ResizeTooSmall) {
    EngineOptions o;
    o.resizeSize = 1;
    HashError error;
    EXPECT_FALSE(o.validate(&error));
    EXPECT_EQ(error.error, HashError::ConfigurationError);
}

}
