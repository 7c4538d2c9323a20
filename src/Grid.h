#pragma once
#include <QtCore>

namespace PHash {

// Square row-major grid of doubles. Used both for the luminance samples of an
// image and for the DCT coefficients derived from them.
class Grid {
public:
    Grid() = default;
    explicit Grid(int size, double fill = 0.0);
    Grid(int size, const QVector<double>& values);

    bool isNull() const { return m_size == 0; }
    int size() const { return m_size; }

    double at(int row, int col) const { return m_values[row * m_size + col]; }
    void set(int row, int col, double v) { m_values[row * m_size + col] = v; }
    const QVector<double>& values() const { return m_values; }

    // Same samples with every row reversed (a horizontal mirror of the image).
    Grid flippedHorizontally() const;

    bool operator==(const Grid& o) const { return m_size == o.m_size && m_values == o.m_values; }
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    int m_size{0};
    QVector<double> m_values;
};

using LuminanceGrid = Grid;
using CoefficientMatrix = Grid;

QDebug operator<<(QDebug dbg, const Grid& grid);

}
