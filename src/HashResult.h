#pragma once
#include <QBitArray>
#include <QtCore>

namespace PHash {

// An ordered bit sequence plus its hex form: most significant bit first, four
// bits per digit, the last digit padded with zero bits.
class HashResult {
public:
    HashResult() = default;
    explicit HashResult(const QBitArray& bits);

    // Decodes a hex hash. bitCount trims trailing pad bits; -1 keeps them all.
    static HashResult fromHex(const QString& hex, int bitCount = -1, bool* ok = nullptr);

    bool isNull() const { return m_hex.isEmpty(); }
    int bitCount() const { return m_bits.size(); }
    const QBitArray& bits() const { return m_bits; }
    QString toHex() const { return m_hex; }
    QString toBitString() const;

    bool operator==(const HashResult& o) const { return m_bits == o.m_bits; }
    bool operator!=(const HashResult& o) const { return !(*this == o); }

private:
    QBitArray m_bits;
    QString m_hex;
};

QDebug operator<<(QDebug dbg, const HashResult& r);

}
