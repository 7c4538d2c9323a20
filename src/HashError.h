#pragma once
#include <QtCore>

namespace PHash {

// Error value filled in by engine calls that can fail. Mirrors the shape of
// QJsonParseError: a kind plus a human readable detail.
struct HashError {
    enum ErrorKind {
        NoError = 0,
        ConfigurationError,
        InputError,
        SourceUnavailableError
    };

    QString errorString() const;

    ErrorKind error{NoError};
    QString detail;
};

// Fills *error when it is non-null. Always returns false so callers can write
// `return fail(error, ...);` from bool functions.
bool fail(HashError* error, HashError::ErrorKind kind, const QString& detail);
void clear(HashError* error);

}
