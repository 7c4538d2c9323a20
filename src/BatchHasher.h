#pragma once
#include <QtCore>
#include <memory>
#include "EngineOptions.h"
#include "HashResult.h"
#include "LuminanceProvider.h"

namespace PHash {

struct BatchEntry {
    QString path;
    HashResult hash;
    HashError error;
};

// Hashes many files on the global thread pool, one Hasher per file.
class BatchHasher {
public:
    BatchHasher(const EngineOptions& options, std::shared_ptr<const ProviderChain> providers);

    // Files are kept as given; directories are walked recursively and only
    // files with an image extension are taken. Result order follows the input.
    static QStringList expandInputs(const QStringList& inputs);
    static bool isImageFile(const QString& path);

    QList<BatchEntry> run(const QStringList& files, const HashConfig& config) const;

private:
    BatchEntry hashOne(const QString& path, const HashConfig& config) const;

    const EngineOptions m_options;
    std::shared_ptr<const ProviderChain> m_providers;
};

}
