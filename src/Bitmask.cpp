#include "Bitmask.h"
#include <algorithm>
#include <cmath>

namespace PHash {

namespace {
// The DC term never takes part in a global threshold.
QVector<double> thresholdSet(const Selection& s) {
    if (s.leadingDc) return s.values.mid(1);
    return s.values;
}

QBitArray compare(const QVector<double>& values, double threshold) {
    QBitArray bits(values.size());
    for (int i = 0; i < values.size(); ++i)
        if (values[i] > threshold) bits.setBit(i);
    return bits;
}
}

double mean(const QVector<double>& values) {
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / values.size();
}

double median(QVector<double> values) {
    std::sort(values.begin(), values.end());
    const int n = values.size();
    if (n % 2) return values[n / 2];
    return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

double compressLog(double x) {
    return std::copysign(std::log1p(std::fabs(x)), x);
}

QBitArray generateBits(const Selection& s, Method method) {
    switch (method) {
    case Method::Average:
        return compare(s.values, mean(thresholdSet(s)));
    case Method::Median:
        return compare(s.values, median(thresholdSet(s)));
    case Method::AverageX:
        return compare(s.values, mean(s.widePool.isEmpty() ? thresholdSet(s) : s.widePool));
    case Method::Log: {
        QVector<double> squashed = s.values;
        for (double& v : squashed) v = compressLog(v);
        Selection t;
        t.values = squashed;
        t.leadingDc = s.leadingDc;
        return compare(squashed, mean(thresholdSet(t)));
    }
    case Method::Diff: {
        // Bit 0 looks back at the DC term, so a selection led by DC gets 0.
        QBitArray bits(s.values.size());
        double prev = s.dc;
        for (int i = 0; i < s.values.size(); ++i) {
            if (s.values[i] > prev) bits.setBit(i);
            prev = s.values[i];
        }
        return bits;
    }
    }
    return {};
}

}
