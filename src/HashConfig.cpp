#include "HashConfig.h"

namespace PHash {

Geometry Geometry::fromString(const QString& text, bool* ok) {
    if (ok) *ok = false;
    const QString t = text.trimmed().toLower();
    const QStringList parts = t.split(QLatin1Char('x'));
    if (parts.size() == 2) {
        bool okW = false, okH = false;
        const int w = parts[0].toInt(&okW);
        const int h = parts[1].toInt(&okH);
        if (!okW || !okH || w <= 0 || w != h) return {};
        if (ok) *ok = true;
        return square(w);
    }
    if (parts.size() == 1) {
        bool okK = false;
        const int k = t.toInt(&okK);
        if (!okK || k <= 0) return {};
        if (ok) *ok = true;
        return linear(k);
    }
    return {};
}

QString Geometry::toString() const {
    if (shape == Square) return QStringLiteral("%1x%1").arg(extent);
    return QString::number(extent);
}

Method methodFromString(const QString& text, bool* ok) {
    static const QHash<QString, Method> names = {
        {QStringLiteral("average"), Method::Average},
        {QStringLiteral("median"), Method::Median},
        {QStringLiteral("average_x"), Method::AverageX},
        {QStringLiteral("log"), Method::Log},
        {QStringLiteral("diff"), Method::Diff},
    };
    const auto it = names.constFind(text.trimmed().toLower());
    if (ok) *ok = it != names.constEnd();
    return it != names.constEnd() ? it.value() : Method::Average;
}

QString methodToString(Method m) {
    switch (m) {
    case Method::Average: return QStringLiteral("average");
    case Method::Median: return QStringLiteral("median");
    case Method::AverageX: return QStringLiteral("average_x");
    case Method::Log: return QStringLiteral("log");
    case Method::Diff: return QStringLiteral("diff");
    }
    return {};
}

HashConfig HashConfig::reducedSquare(int n, Method method) {
    HashConfig c;
    c.geometry = Geometry::square(n);
    c.reduce = true;
    c.method = method;
    return c;
}

HashConfig HashConfig::normalized() const {
    HashConfig c = *this;
    if (c.geometry.shape == Geometry::Linear) c.reduce = false;
    return c;
}

bool HashConfig::validate(int matrixSize, HashError* error) const {
    if (mirror && mirrorproof)
        return fail(error, HashError::ConfigurationError,
                    QStringLiteral("mirror and mirrorproof are mutually exclusive"));
    const int n = geometry.extent;
    if (n <= 0)
        return fail(error, HashError::ConfigurationError,
                    QStringLiteral("geometry must be positive, got %1").arg(n));

    if (geometry.shape == Geometry::Square) {
        if (n > matrixSize)
            return fail(error, HashError::ConfigurationError,
                        QStringLiteral("geometry %1 exceeds the %2x%2 coefficient matrix")
                            .arg(geometry.toString()).arg(matrixSize));
        if (n < 2)
            return fail(error, HashError::ConfigurationError,
                        QStringLiteral("geometry %1 selects no AC coefficient").arg(geometry.toString()));
    } else {
        const qint64 available = qint64(matrixSize) * matrixSize;
        const qint64 needed = method == Method::AverageX ? 2 * qint64(n) : qint64(n);
        if (needed > available)
            return fail(error, HashError::ConfigurationError,
                        QStringLiteral("geometry %1 with %2 needs %3 coefficients, matrix has %4")
                            .arg(geometry.toString(), methodToString(method))
                            .arg(needed).arg(available));
        if (n < 2)
            return fail(error, HashError::ConfigurationError,
                        QStringLiteral("geometry %1 selects no AC coefficient").arg(geometry.toString()));
    }
    clear(error);
    return true;
}

int HashConfig::bitCount() const {
    const int n = geometry.extent;
    if (geometry.shape == Geometry::Linear) return n;
    if (reduce) return (n - 1) * (n + 2) / 2;
    return n * n;
}

QString HashConfig::toString() const {
    QString s = geometry.toString();
    if (reduce && geometry.shape == Geometry::Square) s += QStringLiteral(" reduce");
    s += QLatin1Char(' ') + methodToString(method);
    if (mirror) s += QStringLiteral(" mirror");
    if (mirrorproof) s += QStringLiteral(" mirrorproof");
    return s;
}

size_t qHash(const HashConfig& c, size_t seed) noexcept {
    return qHashMulti(seed, int(c.geometry.shape), c.geometry.extent, c.reduce,
                      int(c.method), c.mirror, c.mirrorproof);
}

}
