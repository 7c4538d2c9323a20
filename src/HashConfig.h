#pragma once
#include <QtCore>
#include "HashError.h"

namespace PHash {

// Which coefficients form the hash: the top-left NxN square, or the first K
// coefficients in diagonal order.
struct Geometry {
    enum Shape { Square, Linear };

    Shape shape{Square};
    int extent{8}; // N for Square, K for Linear

    static Geometry square(int n) { return {Square, n}; }
    static Geometry linear(int k) { return {Linear, k}; }

    // Accepts "NxN" (both sides equal) or a plain positive count "K".
    static Geometry fromString(const QString& text, bool* ok = nullptr);
    QString toString() const;

    bool operator==(const Geometry& o) const { return shape == o.shape && extent == o.extent; }
    bool operator!=(const Geometry& o) const { return !(*this == o); }
};

enum class Method { Average, Median, AverageX, Log, Diff };

Method methodFromString(const QString& text, bool* ok = nullptr);
QString methodToString(Method m);

struct HashConfig {
    Geometry geometry;
    bool reduce{false};
    Method method{Method::Average};
    bool mirror{false};
    bool mirrorproof{false};

    // 7x7 reduced gives 27 bits, 6x6 reduced 20 bits.
    static HashConfig reducedSquare(int n, Method method = Method::Average);

    // Reduce only changes a square selection; normalizing lets configs that
    // differ only in a no-op flag share one cache entry.
    HashConfig normalized() const;

    // Checks the config against an RxR coefficient matrix.
    bool validate(int matrixSize, HashError* error = nullptr) const;

    // Number of bits a valid config produces.
    int bitCount() const;

    QString toString() const;

    bool operator==(const HashConfig& o) const {
        return geometry == o.geometry && reduce == o.reduce && method == o.method
            && mirror == o.mirror && mirrorproof == o.mirrorproof;
    }
    bool operator!=(const HashConfig& o) const { return !(*this == o); }
};

size_t qHash(const HashConfig& c, size_t seed = 0) noexcept;

}
