#pragma once

// ============================================================================
// PaintSnapshot - Immutable compressed copy of a raster
// ============================================================================
// History entries hold snapshots through std::shared_ptr. A snapshot is
// released as soon as the last entry citing it is dropped (redo truncation
// or undo depth eviction).
// ============================================================================

#include <QByteArray>
#include <QImage>
#include <QSize>
#include <memory>

class PaintSnapshot {
public:
    /**
     * @brief Encode a copy of the raster.
     * @return The snapshot, or nullptr if the raster is null or encoding failed.
     */
    static std::shared_ptr<const PaintSnapshot> capture(const QImage& image);

    /**
     * @brief Decode into a new raster.
     * @return Null QImage if the encoded data is corrupt.
     */
    QImage decode() const;

    /**
     * @brief Replace target with the decoded raster.
     * @return False (target untouched) if decoding failed.
     */
    bool restoreInto(QImage& target) const;

    QSize size() const { return QSize(m_width, m_height); }
    QImage::Format format() const { return m_format; }

    /// Size of the compressed pixel data in bytes.
    qsizetype encodedSize() const { return m_data.size(); }

private:
    PaintSnapshot() = default;

    QImage::Format m_format = QImage::Format_Invalid;
    int m_width = 0;
    int m_height = 0;
    qsizetype m_bytesPerLine = 0;
    QByteArray m_data;                  ///< qCompress'ed scanlines
};
