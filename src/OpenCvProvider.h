#pragma once
#include "LuminanceProvider.h"

namespace PHash {

// OpenCV decoders: grayscale load, area interpolation down to NxN.
class OpenCvProvider : public LuminanceProvider {
public:
    QString name() const override { return QStringLiteral("opencv"); }
    bool load(const ImageSource& source, int size,
              LuminanceGrid* grid, QString* errorString) const override;
};

}
