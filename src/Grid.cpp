#include "Grid.h"

namespace PHash {

Grid::Grid(int size, double fill)
    : m_size(size > 0 ? size : 0), m_values(m_size * m_size, fill) {}

Grid::Grid(int size, const QVector<double>& values)
    : m_size(size), m_values(values) {
    if (m_size <= 0 || m_values.size() != m_size * m_size) {
        m_size = 0;
        m_values.clear();
    }
}

Grid Grid::flippedHorizontally() const {
    Grid out(m_size);
    for (int r = 0; r < m_size; ++r)
        for (int c = 0; c < m_size; ++c)
            out.set(r, m_size - 1 - c, at(r, c));
    return out;
}

QDebug operator<<(QDebug dbg, const Grid& grid) {
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "Grid(" << grid.size() << "x" << grid.size() << ")";
    return dbg;
}

}
