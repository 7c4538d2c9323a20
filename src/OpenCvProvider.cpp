#include "OpenCvProvider.h"
#include <opencv2/opencv.hpp>

namespace PHash {

bool OpenCvProvider::load(const ImageSource& source, int size,
                          LuminanceGrid* grid, QString* errorString) const {
    cv::Mat gray;
    try {
        if (source.path.isEmpty()) {
            const cv::Mat raw(1, int(source.data.size()), CV_8UC1,
                              const_cast<char*>(source.data.constData()));
            gray = cv::imdecode(raw, cv::IMREAD_GRAYSCALE);
        } else {
            gray = cv::imread(QFile::encodeName(source.path).toStdString(), cv::IMREAD_GRAYSCALE);
        }
        if (gray.empty()) {
            if (errorString) *errorString = QStringLiteral("unsupported or corrupt image");
            return false;
        }
        cv::Mat small;
        cv::resize(gray, small, cv::Size(size, size), 0, 0, cv::INTER_AREA);

        LuminanceGrid out(size);
        for (int y = 0; y < size; ++y) {
            const uchar* line = small.ptr<uchar>(y);
            for (int x = 0; x < size; ++x)
                out.set(y, x, double(line[x]));
        }
        *grid = out;
    } catch (const cv::Exception& e) {
        if (errorString) *errorString = QString::fromStdString(e.msg);
        return false;
    }
    return true;
}

}
