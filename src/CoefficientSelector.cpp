#include "CoefficientSelector.h"

namespace PHash {

namespace {
QVector<Coordinate> squareOrder(int n, bool reduce) {
    QVector<Coordinate> out;
    out.reserve(n * n);
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            if (reduce && (r + c > n - 1 || (r == 0 && c == 0))) continue;
            out.push_back({r, c});
        }
    }
    return out;
}

QVector<double> gather(const CoefficientMatrix& m, const QVector<Coordinate>& coords, int from = 0) {
    QVector<double> out;
    out.reserve(coords.size() - from);
    for (int i = from; i < coords.size(); ++i)
        out.push_back(m.at(coords[i].row, coords[i].col));
    return out;
}
}

QVector<Coordinate> diagonalOrder(int count, int matrixSize) {
    QVector<Coordinate> out;
    const int total = qMin(count, matrixSize * matrixSize);
    out.reserve(total);
    for (int d = 0; out.size() < total; ++d) {
        const int first = qMax(0, d - (matrixSize - 1));
        const int last = qMin(d, matrixSize - 1);
        for (int r = first; r <= last && out.size() < total; ++r)
            out.push_back({r, d - r});
    }
    return out;
}

QVector<Coordinate> selectionOrder(const Geometry& geometry, bool reduce, int matrixSize) {
    if (geometry.shape == Geometry::Linear)
        return diagonalOrder(geometry.extent, matrixSize);
    return squareOrder(qMin(geometry.extent, matrixSize), reduce);
}

Selection selectCoefficients(const CoefficientMatrix& matrix, const HashConfig& config) {
    const HashConfig c = config.normalized();
    const QVector<Coordinate> order = selectionOrder(c.geometry, c.reduce, matrix.size());

    Selection s;
    s.values = gather(matrix, order);
    s.leadingDc = !order.isEmpty() && order.first() == Coordinate{0, 0};
    s.dc = matrix.at(0, 0);

    if (c.method == Method::AverageX) {
        if (c.geometry.shape == Geometry::Square) {
            // The whole unreduced square, DC excluded.
            s.widePool = gather(matrix, squareOrder(c.geometry.extent, false), 1);
        } else {
            // The next k lowest frequencies beyond the selection count too.
            s.widePool = gather(matrix, diagonalOrder(2 * c.geometry.extent, matrix.size()), 1);
        }
    }
    return s;
}

}
