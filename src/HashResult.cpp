#include "HashResult.h"

namespace PHash {

namespace {
const char kHexDigits[] = "0123456789abcdef";

int hexValue(QChar ch) {
    const ushort u = ch.unicode();
    if (u >= '0' && u <= '9') return u - '0';
    if (u >= 'a' && u <= 'f') return u - 'a' + 10;
    if (u >= 'A' && u <= 'F') return u - 'A' + 10;
    return -1;
}
}

HashResult::HashResult(const QBitArray& bits) : m_bits(bits) {
    const int n = bits.size();
    m_hex.reserve((n + 3) / 4);
    for (int i = 0; i < n; i += 4) {
        int nibble = 0;
        for (int j = 0; j < 4; ++j) {
            nibble <<= 1;
            if (i + j < n && bits.testBit(i + j)) nibble |= 1;
        }
        m_hex += QLatin1Char(kHexDigits[nibble]);
    }
}

HashResult HashResult::fromHex(const QString& hex, int bitCount, bool* ok) {
    if (ok) *ok = false;
    const int total = hex.size() * 4;
    if (hex.isEmpty() || bitCount > total) return {};
    QBitArray bits(bitCount < 0 ? total : bitCount);
    for (int i = 0; i < hex.size(); ++i) {
        const int v = hexValue(hex.at(i));
        if (v < 0) return {};
        for (int j = 0; j < 4; ++j) {
            const int pos = i * 4 + j;
            if (pos < bits.size() && (v & (8 >> j))) bits.setBit(pos);
        }
    }
    if (ok) *ok = true;
    return HashResult(bits);
}

QString HashResult::toBitString() const {
    QString s(m_bits.size(), QLatin1Char('0'));
    for (int i = 0; i < m_bits.size(); ++i)
        if (m_bits.testBit(i)) s[i] = QLatin1Char('1');
    return s;
}

QDebug operator<<(QDebug dbg, const HashResult& r) {
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "HashResult(" << r.bitCount() << " bits, " << r.toHex() << ")";
    return dbg;
}

}
