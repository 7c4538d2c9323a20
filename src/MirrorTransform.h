#pragma once
#include "CoefficientSelector.h"

namespace PHash {

// Coefficients of the horizontally mirrored image: flipping x negates every
// coefficient in an odd column. Returns a new matrix.
CoefficientMatrix mirrored(const CoefficientMatrix& matrix);

// Replaces every coefficient of the selection (threshold sets included) by its
// magnitude so the bits no longer depend on the sign flip a mirror causes.
void makeMirrorproof(Selection& selection);

}
