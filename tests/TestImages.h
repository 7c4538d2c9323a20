#pragma once
#include <QBuffer>
#include <QImage>
#include <QPainter>

namespace PHash {
namespace fixtures {

// A 128x96 picture with a diagonal gradient and two blocks, nothing symmetric.
inline QImage samplePicture() {
    QImage img(128, 96, QImage::Format_RGB32);
    for (int y = 0; y < img.height(); ++y)
        for (int x = 0; x < img.width(); ++x)
            img.setPixel(x, y, qRgb(x * 2, (x + y) % 256, y * 2));
    QPainter p(&img);
    p.fillRect(10, 10, 30, 50, Qt::white);
    p.fillRect(80, 40, 20, 20, Qt::black);
    p.end();
    return img;
}

inline QByteArray encodePng(const QImage& img) {
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    img.save(&buffer, "PNG");
    return bytes;
}

}
}
