#pragma once
#include "Grid.h"
#include "HashConfig.h"

namespace PHash {

struct Coordinate {
    int row;
    int col;
    bool operator==(const Coordinate& o) const { return row == o.row && col == o.col; }
};

// Coefficients picked from a matrix, in canonical bit order.
struct Selection {
    QVector<double> values;
    bool leadingDc{false}; // values[0] is the DC term
    double dc{0.0};        // DC term of the matrix the values came from
    QVector<double> widePool; // average_x threshold set, DC excluded
};

// First `count` coordinates by increasing row + col, rows ascending within a
// diagonal. Clipped to an NxN matrix.
QVector<Coordinate> diagonalOrder(int count, int matrixSize);

// Coordinates a geometry visits. Square is row-major; a reduced square keeps
// row + col <= n - 1 and drops (0,0).
QVector<Coordinate> selectionOrder(const Geometry& geometry, bool reduce, int matrixSize);

// The config must already be validated against matrix.size().
Selection selectCoefficients(const CoefficientMatrix& matrix, const HashConfig& config);

}
