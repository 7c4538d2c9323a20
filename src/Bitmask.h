#pragma once
#include <QBitArray>
#include "CoefficientSelector.h"

namespace PHash {

// Threshold helpers, exposed for tests. Both expect a non-empty set.
double mean(const QVector<double>& values);
double median(QVector<double> values);

// sign(x) * ln(1 + |x|): monotonic, keeps the sign, compresses magnitude.
double compressLog(double x);

// One bit per selected value, in selection order. A bit is set only when the
// value is strictly greater than its threshold.
QBitArray generateBits(const Selection& selection, Method method);

}
