#include "EngineOptions.h"
#include "LuminanceProvider.h"

namespace PHash {

QStringList EngineOptions::defaultBackends() {
    return ProviderChain::availableBackends();
}

EngineOptions EngineOptions::fromSettings(const QSettings& s, HashError* error) {
    EngineOptions o;
    bool ok = true;

    if (s.contains(QStringLiteral("phash/resize"))) {
        o.resizeSize = s.value(QStringLiteral("phash/resize")).toInt(&ok);
        if (!ok) {
            fail(error, HashError::ConfigurationError,
                 QStringLiteral("resize is not a number: %1").arg(s.value(QStringLiteral("phash/resize")).toString()));
            return {};
        }
    }
    if (s.contains(QStringLiteral("phash/geometry"))) {
        const QString g = s.value(QStringLiteral("phash/geometry")).toString();
        o.defaultConfig.geometry = Geometry::fromString(g, &ok);
        if (!ok) {
            fail(error, HashError::ConfigurationError, QStringLiteral("invalid geometry '%1'").arg(g));
            return {};
        }
    }
    if (s.contains(QStringLiteral("phash/method"))) {
        const QString m = s.value(QStringLiteral("phash/method")).toString();
        o.defaultConfig.method = methodFromString(m, &ok);
        if (!ok) {
            fail(error, HashError::ConfigurationError, QStringLiteral("unknown method '%1'").arg(m));
            return {};
        }
    }
    o.defaultConfig.reduce = s.value(QStringLiteral("phash/reduce"), false).toBool();
    o.defaultConfig.mirror = s.value(QStringLiteral("phash/mirror"), false).toBool();
    o.defaultConfig.mirrorproof = s.value(QStringLiteral("phash/mirrorproof"), false).toBool();
    if (s.contains(QStringLiteral("phash/backends")))
        o.backends = s.value(QStringLiteral("phash/backends")).toStringList();

    if (!o.validate(error)) return {};
    return o;
}

bool EngineOptions::validate(HashError* error) const {
    if (resizeSize < 2)
        return fail(error, HashError::ConfigurationError,
                    QStringLiteral("resize must be at least 2, got %1").arg(resizeSize));
    if (backends.isEmpty())
        return fail(error, HashError::ConfigurationError, QStringLiteral("no image backend given"));
    return defaultConfig.validate(resizeSize, error);
}

}
