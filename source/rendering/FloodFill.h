#pragma once

// ============================================================================
// FloodFill - Contiguous region fill primitive
// ============================================================================

#include <QColor>
#include <QImage>

namespace FloodFill {

/**
 * @brief Compute the contiguous region around (x, y) filled with color.
 * @param buffer Raster to analyze.
 * @param x Start column in buffer pixels.
 * @param y Start row in buffer pixels.
 * @param color Fill color.
 * @param tolerance Maximum per-channel difference to the start pixel that still
 *        counts as part of the region (0 = exact match).
 * @return A raster of the buffer size containing color inside the region and
 *         transparency elsewhere, ready to be composited with QPainter (which
 *         honors any selection clip). Null when (x, y) lies outside the buffer.
 */
QImage floodFill(const QImage& buffer, int x, int y, const QColor& color, int tolerance = 0);

} // namespace FloodFill
