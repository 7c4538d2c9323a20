#include "MirrorTransform.h"
#include <cmath>

namespace PHash {

CoefficientMatrix mirrored(const CoefficientMatrix& matrix) {
    const int n = matrix.size();
    CoefficientMatrix out = matrix;
    for (int r = 0; r < n; ++r)
        for (int c = 1; c < n; c += 2)
            out.set(r, c, -matrix.at(r, c));
    return out;
}

void makeMirrorproof(Selection& selection) {
    for (double& v : selection.values) v = std::fabs(v);
    for (double& v : selection.widePool) v = std::fabs(v);
    selection.dc = std::fabs(selection.dc);
}

}
