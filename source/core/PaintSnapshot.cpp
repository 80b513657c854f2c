#include "PaintSnapshot.h"

#include <QDebug>
#include <cstring>

std::shared_ptr<const PaintSnapshot> PaintSnapshot::capture(const QImage& image)
{
    if (image.isNull()) {
        qWarning() << "PaintSnapshot::capture: raster not available";
        return nullptr;
    }

    std::shared_ptr<PaintSnapshot> snapshot(new PaintSnapshot());
    snapshot->m_format = image.format();
    snapshot->m_width = image.width();
    snapshot->m_height = image.height();
    snapshot->m_bytesPerLine = image.bytesPerLine();
    snapshot->m_data = qCompress(image.constBits(), image.sizeInBytes());

    if (snapshot->m_data.isEmpty()) {
        qWarning() << "PaintSnapshot::capture: failed to encode" << image.size();
        return nullptr;
    }
    return snapshot;
}

QImage PaintSnapshot::decode() const
{
    const QByteArray raw = qUncompress(m_data);
    if (raw.size() != m_bytesPerLine * m_height) {
        qWarning() << "PaintSnapshot::decode: corrupt data, expected" << m_bytesPerLine * m_height
                   << "bytes, got" << raw.size();
        return QImage();
    }

    QImage image(m_width, m_height, m_format);
    if (image.isNull()) {
        qWarning() << "PaintSnapshot::decode: failed to allocate" << size();
        return QImage();
    }

    const qsizetype lineBytes = qMin<qsizetype>(m_bytesPerLine, image.bytesPerLine());
    for (int y = 0; y < m_height; ++y) {
        std::memcpy(image.scanLine(y), raw.constData() + y * m_bytesPerLine, static_cast<size_t>(lineBytes));
    }
    return image;
}

bool PaintSnapshot::restoreInto(QImage& target) const
{
    QImage image = decode();
    if (image.isNull()) {
        return false;
    }
    target = image;
    return true;
}
