#pragma once
#include <QtCore>
#include <memory>
#include <vector>
#include "Grid.h"
#include "HashError.h"

namespace PHash {

// Where an image comes from: a file on disk or encoded bytes in memory.
struct ImageSource {
    QString path;
    QByteArray data;

    static ImageSource fromFile(const QString& path) { return {path, {}}; }
    static ImageSource fromData(const QByteArray& data) { return {{}, data}; }

    QString describe() const;
};

// Decodes an image and resizes it to an NxN grid of luminance samples.
//
// Different providers (and different versions of the same decoding library)
// resample differently. Hashes are only comparable when they were produced by
// the same provider at the same grid size.
class LuminanceProvider {
public:
    virtual ~LuminanceProvider() = default;

    virtual QString name() const = 0;
    virtual bool load(const ImageSource& source, int size,
                      LuminanceGrid* grid, QString* errorString) const = 0;
};

// Qt image I/O: EXIF orientation applied, 8-bit grayscale, smooth scaling.
class QImageProvider : public LuminanceProvider {
public:
    QString name() const override { return QStringLiteral("qimage"); }
    bool load(const ImageSource& source, int size,
              LuminanceGrid* grid, QString* errorString) const override;
};

// Providers tried in order; the first one that decodes the image wins.
class ProviderChain {
public:
    ProviderChain() = default;
    ProviderChain(const ProviderChain&) = delete;
    ProviderChain& operator=(const ProviderChain&) = delete;

    void append(std::unique_ptr<LuminanceProvider> provider);
    int size() const { return int(m_providers.size()); }
    QStringList names() const;

    LuminanceGrid load(const ImageSource& source, int size, HashError* error = nullptr) const;

    // Every backend compiled in: "qimage", plus "opencv" when built with OpenCV.
    static QStringList availableBackends();

    // Builds a chain from backend names, in the given order. Unknown names are
    // a configuration error.
    static std::shared_ptr<const ProviderChain> create(const QStringList& backends,
                                                       HashError* error = nullptr);

private:
    std::vector<std::unique_ptr<LuminanceProvider>> m_providers;
};

}
