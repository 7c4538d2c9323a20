#include "BatchHasher.h"
#include "Hasher.h"
#include "Logging.h"
#include <QtConcurrent>
#include <atomic>

namespace PHash {

BatchHasher::BatchHasher(const EngineOptions& options, std::shared_ptr<const ProviderChain> providers)
    : m_options(options), m_providers(std::move(providers)) {}

bool BatchHasher::isImageFile(const QString& path) {
    static const QStringList exts = {"png", "jpg", "jpeg", "bmp", "gif", "webp", "tiff", "tif", "pgm", "ppm"};
    return exts.contains(QFileInfo(path).suffix().toLower());
}

QStringList BatchHasher::expandInputs(const QStringList& inputs) {
    QStringList files;
    for (const QString& in : inputs) {
        const QFileInfo fi(in);
        if (!fi.isDir()) {
            files << in;
            continue;
        }
        QStringList found;
        QDirIterator it(in, QDir::Files, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            const QString p = it.next();
            if (isImageFile(p)) found << p;
        }
        found.sort();
        files << found;
    }
    return files;
}

BatchEntry BatchHasher::hashOne(const QString& path, const HashConfig& config) const {
    BatchEntry e;
    e.path = path;
    Hasher hasher(ImageSource::fromFile(path), m_options, m_providers);
    e.hash = hasher.computeHash(config, &e.error);
    return e;
}

QList<BatchEntry> BatchHasher::run(const QStringList& files, const HashConfig& config) const {
    const int total = files.size();
    std::atomic<int> done{0};
    const QList<BatchEntry> out = QtConcurrent::blockingMapped<QList<BatchEntry>>(
        files, [this, &config, &done, total](const QString& path) {
            BatchEntry e = hashOne(path, config);
            const int n = ++done;
            if (n % 100 == 0 || n == total)
                qCInfo(lcBatch) << "hashed" << n << "of" << total;
            return e;
        });
    return out;
}

}
