#pragma once
#include <QRandomGenerator>
#include "Grid.h"

namespace PHash {
namespace fixtures {

// 8-bit noise, reproducible from the seed.
inline LuminanceGrid randomGrid(int size, quint32 seed) {
    QRandomGenerator gen(seed);
    LuminanceGrid g(size);
    for (int r = 0; r < size; ++r)
        for (int c = 0; c < size; ++c)
            g.set(r, c, double(gen.bounded(256)));
    return g;
}

// The same grid with every sample moved by -1, 0 or +1.
inline LuminanceGrid jittered(const LuminanceGrid& src, quint32 seed) {
    QRandomGenerator gen(seed);
    LuminanceGrid g = src;
    for (int r = 0; r < src.size(); ++r)
        for (int c = 0; c < src.size(); ++c)
            g.set(r, c, src.at(r, c) + double(gen.bounded(3) - 1));
    return g;
}

}
}
