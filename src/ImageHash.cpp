#include "ImageHash.h"

namespace PHash {

namespace {
const int kChunkDigits = 16;

bool isHex(const QString& s) {
    for (QChar ch : s) {
        const ushort u = ch.unicode();
        const bool digit = (u >= '0' && u <= '9') || (u >= 'a' && u <= 'f') || (u >= 'A' && u <= 'F');
        if (!digit) return false;
    }
    return true;
}

quint64 chunkValue(const QString& hex, int from) {
    // Characters were checked up front, the conversion cannot fail.
    return hex.mid(from, kChunkDigits).toULongLong(nullptr, 16);
}
}

int hammingDistance(const QString& hexA, const QString& hexB, HashError* error) {
    if (hexA.size() != hexB.size()) {
        fail(error, HashError::InputError,
             QStringLiteral("hash lengths differ (%1 vs %2 bits)").arg(hexA.size() * 4).arg(hexB.size() * 4));
        return -1;
    }
    if (!isHex(hexA) || !isHex(hexB)) {
        fail(error, HashError::InputError, QStringLiteral("hash contains non-hex characters"));
        return -1;
    }
    clear(error);

    if (hexA.size() <= kChunkDigits)
        return hammingDistance(chunkValue(hexA, 0), chunkValue(hexB, 0));

    int distance = 0;
    for (int i = 0; i < hexA.size(); i += kChunkDigits)
        distance += hammingDistance(chunkValue(hexA, i), chunkValue(hexB, i));
    return distance;
}

}
