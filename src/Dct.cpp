#include "Dct.h"
#include <cmath>

namespace PHash {

Dct::Dct(int size) : m_size(size), m_cos(size * size) {
    const double PI = 3.14159265358979323846;
    for (int k = 0; k < m_size; ++k)
        for (int n = 0; n < m_size; ++n)
            m_cos[k * m_size + n] = cos((PI / m_size) * (n + 0.5) * k);
}

void Dct::transform1D(const double* in, double* out, int stride) const {
    const int N = m_size;
    for (int k = 0; k < N; ++k) {
        const double* c = m_cos.constData() + k * N;
        double sum = 0.0;
        for (int n = 0; n < N; ++n)
            sum += in[n * stride] * c[n];
        out[k * stride] = sum;
    }
}

CoefficientMatrix Dct::forward(const LuminanceGrid& grid) const {
    const int N = m_size;
    if (grid.size() != N) return {};

    // DCT rows then cols
    QVector<double> rows(N * N);
    const double* a = grid.values().constData();
    for (int y = 0; y < N; ++y)
        transform1D(a + y * N, rows.data() + y * N, 1);

    QVector<double> out(N * N);
    for (int x = 0; x < N; ++x)
        transform1D(rows.constData() + x, out.data() + x, N);

    double magnitude = 0.0;
    for (double v : grid.values()) magnitude += std::fabs(v);
    const double epsilon = magnitude * 1e-9;
    for (double& v : out)
        if (std::fabs(v) < epsilon) v = 0.0;

    return CoefficientMatrix(N, out);
}

}
