#include "LuminanceProvider.h"
#include "Logging.h"
#include <QBuffer>
#include <QImageReader>
#ifdef HAVE_OPENCV
#include "OpenCvProvider.h"
#endif

namespace PHash {

QString ImageSource::describe() const {
    if (!path.isEmpty()) return path;
    return QStringLiteral("<%1 bytes in memory>").arg(data.size());
}

bool QImageProvider::load(const ImageSource& source, int size,
                          LuminanceGrid* grid, QString* errorString) const {
    QBuffer buffer;
    QImageReader reader;
    if (source.path.isEmpty()) {
        buffer.setData(source.data);
        buffer.open(QIODevice::ReadOnly);
        reader.setDevice(&buffer);
    } else {
        reader.setFileName(source.path);
    }
    reader.setAutoTransform(true);

    const QImage decoded = reader.read();
    if (decoded.isNull()) {
        if (errorString) *errorString = reader.errorString();
        return false;
    }

    // Smooth scaling may change the pixel format, so convert to gray last.
    const QImage img = decoded.scaled(size, size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation)
                           .convertToFormat(QImage::Format_Grayscale8);
    if (img.width() != size || img.height() != size) {
        if (errorString) *errorString = QStringLiteral("could not resize to %1x%1").arg(size);
        return false;
    }

    LuminanceGrid out(size);
    for (int y = 0; y < size; ++y) {
        const uchar* line = img.constScanLine(y);
        for (int x = 0; x < size; ++x)
            out.set(y, x, double(line[x]));
    }
    *grid = out;
    return true;
}

void ProviderChain::append(std::unique_ptr<LuminanceProvider> provider) {
    m_providers.push_back(std::move(provider));
}

QStringList ProviderChain::names() const {
    QStringList out;
    for (const auto& p : m_providers) out << p->name();
    return out;
}

LuminanceGrid ProviderChain::load(const ImageSource& source, int size, HashError* error) const {
    QStringList failures;
    for (const auto& p : m_providers) {
        LuminanceGrid grid;
        QString why;
        if (p->load(source, size, &grid, &why)) {
            qCDebug(lcSource) << p->name() << "decoded" << source.describe();
            clear(error);
            return grid;
        }
        qCDebug(lcSource) << p->name() << "failed on" << source.describe() << why;
        failures << QStringLiteral("%1: %2").arg(p->name(), why);
    }
    if (failures.isEmpty()) failures << QStringLiteral("no image backend configured");
    qCWarning(lcSource) << "cannot read" << source.describe();
    fail(error, HashError::SourceUnavailableError,
         QStringLiteral("%1 (%2)").arg(source.describe(), failures.join(QStringLiteral("; "))));
    return {};
}

QStringList ProviderChain::availableBackends() {
    QStringList out{QStringLiteral("qimage")};
#ifdef HAVE_OPENCV
    out << QStringLiteral("opencv");
#endif
    return out;
}

std::shared_ptr<const ProviderChain> ProviderChain::create(const QStringList& backends,
                                                           HashError* error) {
    auto chain = std::make_shared<ProviderChain>();
    for (const QString& raw : backends) {
        const QString name = raw.trimmed().toLower();
        if (name == QLatin1String("qimage")) {
            chain->append(std::make_unique<QImageProvider>());
#ifdef HAVE_OPENCV
        } else if (name == QLatin1String("opencv")) {
            chain->append(std::make_unique<OpenCvProvider>());
#endif
        } else {
            fail(error, HashError::ConfigurationError,
                 QStringLiteral("unknown image backend '%1' (available: %2)")
                     .arg(raw, availableBackends().join(QStringLiteral(", "))));
            return {};
        }
    }
    if (chain->size() == 0) {
        fail(error, HashError::ConfigurationError, QStringLiteral("no image backend given"));
        return {};
    }
    clear(error);
    return chain;
}

}
