#include <QCoreApplication>
#include <QCommandLineParser>
#include <QImageReader>
#include <QTextStream>
#include "BatchHasher.h"
#include "Hasher.h"
#include "ImageHash.h"
#include "Logging.h"

using namespace PHash;

namespace {
enum ExitCode { ExitOk = 0, ExitUsage = 1, ExitUnreadable = 2 };

QTextStream& out() { static QTextStream s(stdout); return s; }
QTextStream& err() { static QTextStream s(stderr); return s; }

int usageError(const QString& message) {
    err() << "phash: " << message << Qt::endl;
    return ExitUsage;
}

void dumpMatrix(const QString& path, const CoefficientMatrix& m) {
    out() << "# " << path << " (" << m.size() << "x" << m.size() << ")" << Qt::endl;
    for (int r = 0; r < m.size(); ++r) {
        QStringList row;
        for (int c = 0; c < m.size(); ++c)
            row << QString::number(m.at(r, c), 'f', 3);
        out() << row.join(QLatin1Char(' ')) << Qt::endl;
    }
}
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("phash");
    QCoreApplication::setOrganizationName("Local");
    QCoreApplication::setApplicationVersion("0.1.0");

    // Raise image allocation limit to handle large images, but avoid unbounded
    QImageReader::setAllocationLimit(1024); // in megabytes

    QCommandLineParser parser;
    parser.setApplicationDescription("Perceptual DCT hashes of images.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("inputs", "Image files or directories, or two hex hashes with --compare.", "<input>...");

    const QCommandLineOption geometryOpt("geometry", "Coefficient selection: NxN or a count K.", "geometry");
    const QCommandLineOption reduceOpt("reduce", "Keep the upper-left triangle of a square selection, without DC.");
    const QCommandLineOption methodOpt("method", "average, median, average_x, log or diff.", "method");
    const QCommandLineOption mirrorOpt("mirror", "Hash the horizontally mirrored image.");
    const QCommandLineOption mirrorproofOpt("mirrorproof", "Hash that does not change under a horizontal flip.");
    const QCommandLineOption resizeOpt("resize", "Luminance grid size.", "size");
    const QCommandLineOption backendOpt("backend", "Comma separated image backends, tried in order.", "names");
    const QCommandLineOption settingsOpt("settings", "INI file with a [phash] group of defaults.", "file");
    const QCommandLineOption bitsOpt("bits", "Print hashes as 0/1 strings instead of hex.");
    const QCommandLineOption dumpOpt("dump-dct", "Print the coefficient matrix of each image.");
    const QCommandLineOption compareOpt("compare", "Print the Hamming distance between two hex hashes.");
    const QCommandLineOption verboseOpt({"v", "verbose"}, "Debug logging.");
    parser.addOptions({geometryOpt, reduceOpt, methodOpt, mirrorOpt, mirrorproofOpt, resizeOpt,
                       backendOpt, settingsOpt, bitsOpt, dumpOpt, compareOpt, verboseOpt});
    parser.process(app);

    if (parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules(QStringLiteral("phash.*.debug=true"));

    const QStringList args = parser.positionalArguments();

    if (parser.isSet(compareOpt)) {
        if (args.size() != 2) return usageError("--compare takes exactly two hashes");
        HashError error;
        const int d = hammingDistance(args[0], args[1], &error);
        if (d < 0) return usageError(error.errorString());
        out() << d << Qt::endl;
        return ExitOk;
    }

    if (args.isEmpty()) return usageError("no input given, see --help");

    HashError error;
    EngineOptions options;
    if (parser.isSet(settingsOpt)) {
        const QString file = parser.value(settingsOpt);
        if (!QFileInfo::exists(file)) return usageError(QString("settings file %1 not found").arg(file));
        const QSettings settings(file, QSettings::IniFormat);
        options = EngineOptions::fromSettings(settings, &error);
        if (error.error != HashError::NoError) return usageError(error.errorString());
    }

    HashConfig& config = options.defaultConfig;
    bool ok = true;
    if (parser.isSet(geometryOpt)) {
        config.geometry = Geometry::fromString(parser.value(geometryOpt), &ok);
        if (!ok) return usageError(QString("invalid geometry '%1'").arg(parser.value(geometryOpt)));
    }
    if (parser.isSet(methodOpt)) {
        config.method = methodFromString(parser.value(methodOpt), &ok);
        if (!ok) return usageError(QString("unknown method '%1'").arg(parser.value(methodOpt)));
    }
    if (parser.isSet(resizeOpt)) {
        options.resizeSize = parser.value(resizeOpt).toInt(&ok);
        if (!ok) return usageError(QString("invalid resize '%1'").arg(parser.value(resizeOpt)));
    }
    if (parser.isSet(backendOpt))
        options.backends = parser.value(backendOpt).split(QLatin1Char(','), Qt::SkipEmptyParts);
    if (parser.isSet(reduceOpt)) config.reduce = true;
    if (parser.isSet(mirrorOpt)) config.mirror = true;
    if (parser.isSet(mirrorproofOpt)) config.mirrorproof = true;

    if (!options.validate(&error)) return usageError(error.errorString());
    const std::shared_ptr<const ProviderChain> providers = ProviderChain::create(options.backends, &error);
    if (!providers) return usageError(error.errorString());
    qCDebug(lcEngine) << "backends" << providers->names() << "config" << config.toString();

    const QStringList files = BatchHasher::expandInputs(args);
    int rc = ExitOk;

    if (parser.isSet(dumpOpt)) {
        for (const QString& path : files) {
            Hasher hasher(ImageSource::fromFile(path), options, providers);
            const CoefficientMatrix m = hasher.coefficientMatrix(&error);
            if (m.isNull()) {
                err() << "phash: " << error.errorString() << Qt::endl;
                rc = ExitUnreadable;
                continue;
            }
            dumpMatrix(path, m);
        }
        return rc;
    }

    const BatchHasher batch(options, providers);
    for (const BatchEntry& e : batch.run(files, config)) {
        if (e.hash.isNull()) {
            err() << "phash: " << e.error.errorString() << Qt::endl;
            rc = ExitUnreadable;
            continue;
        }
        out() << (parser.isSet(bitsOpt) ? e.hash.toBitString() : e.hash.toHex()) << "  " << e.path << Qt::endl;
    }
    return rc;
}
