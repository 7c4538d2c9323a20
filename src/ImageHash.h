#pragma once
#include <QtCore>
#include "HashError.h"

namespace PHash {

inline int hammingDistance(quint64 a, quint64 b) {
    return int(qPopulationCount(a ^ b));
}

// Number of differing bits between two hex encoded hashes. Both must have the
// same number of digits and contain only hex digits; otherwise an input error
// is reported and -1 returned. Up to 16 digits is a single 64-bit xor, longer
// hashes are compared 16 digits at a time.
int hammingDistance(const QString& hexA, const QString& hexB, HashError* error = nullptr);

}
