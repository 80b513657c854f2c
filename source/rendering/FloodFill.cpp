#include "FloodFill.h"

#include <QVector>
#include <QPoint>
#include <QtGlobal>
#include <QRgb>
#include <cstdlib>

namespace FloodFill {

namespace {

bool matches(QRgb pixel, QRgb target, int tolerance)
{
    if (tolerance <= 0) {
        return pixel == target;
    }
    return std::abs(qRed(pixel) - qRed(target)) <= tolerance &&
           std::abs(qGreen(pixel) - qGreen(target)) <= tolerance &&
           std::abs(qBlue(pixel) - qBlue(target)) <= tolerance &&
           std::abs(qAlpha(pixel) - qAlpha(target)) <= tolerance;
}

} // namespace

QImage floodFill(const QImage& buffer, int x, int y, const QColor& color, int tolerance)
{
    if (buffer.isNull() || x < 0 || y < 0 || x >= buffer.width() || y >= buffer.height()) {
        return QImage();
    }

    const QImage source = buffer.format() == QImage::Format_ARGB32_Premultiplied
                              ? buffer
                              : buffer.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    const int width = source.width();
    const int height = source.height();
    const QRgb target = reinterpret_cast<const QRgb*>(source.constScanLine(y))[x];
    const QRgb fill = qPremultiply(color.rgba());

    QImage result(width, height, QImage::Format_ARGB32_Premultiplied);
    result.fill(Qt::transparent);

    // visited pixels are marked in result, so a transparent fill color needs its own bookkeeping
    QVector<bool> visited(width * height, false);

    // Scanline fill: each stack entry is a seed, the whole horizontal run
    // around it is filled and the rows above and below are scanned for new seeds.
    QVector<QPoint> stack;
    stack.append(QPoint(x, y));

    while (!stack.isEmpty()) {
        const QPoint seed = stack.takeLast();
        const QRgb* row = reinterpret_cast<const QRgb*>(source.constScanLine(seed.y()));
        if (visited[seed.y() * width + seed.x()] || !matches(row[seed.x()], target, tolerance)) {
            continue;
        }

        int left = seed.x();
        while (left > 0 && !visited[seed.y() * width + left - 1] && matches(row[left - 1], target, tolerance)) {
            --left;
        }
        int right = seed.x();
        while (right < width - 1 && !visited[seed.y() * width + right + 1] && matches(row[right + 1], target, tolerance)) {
            ++right;
        }

        QRgb* out = reinterpret_cast<QRgb*>(result.scanLine(seed.y()));
        for (int i = left; i <= right; ++i) {
            out[i] = fill;
            visited[seed.y() * width + i] = true;
        }

        for (int dy = -1; dy <= 1; dy += 2) {
            const int ny = seed.y() + dy;
            if (ny < 0 || ny >= height) {
                continue;
            }
            const QRgb* adjacent = reinterpret_cast<const QRgb*>(source.constScanLine(ny));
            bool inRun = false;
            for (int i = left; i <= right; ++i) {
                const bool candidate = !visited[ny * width + i] && matches(adjacent[i], target, tolerance);
                if (candidate && !inRun) {
                    stack.append(QPoint(i, ny));
                }
                inRun = candidate;
            }
        }
    }
    return result;
}

} // namespace FloodFill
