#include "ImageMath.h"
#include "UnitMath.h"

#include <QtMath>

namespace ImageMath {

QSizeF scaleToRatio(qreal imageWidth, qreal imageHeight, qreal destWidth, qreal destHeight)
{
    if (imageWidth <= 0 || imageHeight <= 0) {
        return QSizeF(destWidth, destHeight);
    }

    qreal height = destWidth;
    if (!isSquare(imageWidth, imageHeight)) {
        height = destWidth * (imageHeight / imageWidth);
    }

    if (height < destHeight) {
        destWidth *= (destHeight / height);
        height = destHeight;
    }
    return QSizeF(destWidth, height);
}

QSize constrain(int width, int height, qint64 maxPixels)
{
    if (width <= 0 || height <= 0 || maxPixels <= 0) {
        return QSize(width, height);
    }
    const qint64 pixels = static_cast<qint64>(width) * height;
    if (pixels <= maxPixels) {
        return QSize(width, height);
    }

    const qreal ratio = qSqrt(static_cast<qreal>(maxPixels)) / qSqrt(static_cast<qreal>(pixels));
    int newWidth  = qMax(1, UnitMath::fastRound(width * ratio));
    int newHeight = qMax(1, UnitMath::fastRound(height * ratio));

    // rounding up can overshoot the budget by a row or column, take it off the longer side
    while (static_cast<qint64>(newWidth) * newHeight > maxPixels) {
        if (newWidth >= newHeight && newWidth > 1) {
            --newWidth;
        } else if (newHeight > 1) {
            --newHeight;
        } else {
            break;
        }
    }
    return QSize(newWidth, newHeight);
}

} // namespace ImageMath
