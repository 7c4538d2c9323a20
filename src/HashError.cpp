#include "HashError.h"

namespace PHash {

QString HashError::errorString() const {
    QString kind;
    switch (error) {
    case NoError: return QStringLiteral("no error");
    case ConfigurationError: kind = QStringLiteral("configuration error"); break;
    case InputError: kind = QStringLiteral("input error"); break;
    case SourceUnavailableError: kind = QStringLiteral("source unavailable"); break;
    }
    if (detail.isEmpty()) return kind;
    return kind + QStringLiteral(": ") + detail;
}

bool fail(HashError* error, HashError::ErrorKind kind, const QString& detail) {
    if (error) {
        error->error = kind;
        error->detail = detail;
    }
    return false;
}

void clear(HashError* error) {
    if (!error) return;
    error->error = HashError::NoError;
    error->detail.clear();
}

}
