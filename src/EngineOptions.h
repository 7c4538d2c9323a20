#pragma once
#include <QtCore>
#include "HashConfig.h"

namespace PHash {

// Defaults handed to every Hasher at construction. Hashers keep their own
// copy, so changing an EngineOptions value later does not affect them.
struct EngineOptions {
    int resizeSize{32};
    HashConfig defaultConfig;
    QStringList backends = defaultBackends();

    static QStringList defaultBackends();

    // Reads the [phash] group: resize, geometry, reduce, method, mirror,
    // mirrorproof, backends. Missing keys keep their defaults.
    static EngineOptions fromSettings(const QSettings& settings, HashError* error = nullptr);

    bool validate(HashError* error = nullptr) const;
};

}
