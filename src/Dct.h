#pragma once
#include "Grid.h"

namespace PHash {

// Unscaled two-dimensional DCT-II:
//   X[v][u] = sum_y sum_x g[y][x] * cos(pi/N * (y + 0.5) * v) * cos(pi/N * (x + 0.5) * u)
// Column u is the horizontal frequency, row v the vertical one, X[0][0] is the
// sum of all samples (the DC term).
//
// Coefficients smaller than 1e-9 of the total sample magnitude are rounding
// residue and come out as exactly 0, so flat regions hash the same on every
// platform.
class Dct {
public:
    explicit Dct(int size);

    int size() const { return m_size; }
    CoefficientMatrix forward(const LuminanceGrid& grid) const;

private:
    void transform1D(const double* in, double* out, int stride) const;

    int m_size;
    QVector<double> m_cos; // m_cos[k * N + n] = cos(pi/N * (n + 0.5) * k)
};

}
