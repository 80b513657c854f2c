#pragma once

// ============================================================================
// BrushRenderer - Brush state and the stroke rasterization primitive
// ============================================================================

#include <QColor>
#include <QPointF>
#include <QString>
#include <QVector>

class QPainter;

/**
 * @brief Options of the active paint tool.
 */
struct BrushOptions {
    qreal size = 5.0;               ///< Brush radius in document pixels
    qreal opacity = 1.0;            ///< Opacity the stroke is committed with
    int strokes = 1;                ///< Amount of parallel bristle strokes
    bool smartFill = false;         ///< Fill tool: flood fill instead of filling the selection
    bool hasCloneSource = false;    ///< Clone tool: whether cloneSource is set
    QPointF cloneSource;            ///< Clone tool: source anchor in document coordinates
    QString sourceLayerId;          ///< Clone tool: layer pixels are read from (empty = own layer)

    void setCloneSource(const QPointF& point) { cloneSource = point; hasCloneSource = true; }
    void clearCloneSource() { cloneSource = QPointF(); hasCloneSource = false; }
};

/**
 * @brief State of an in-progress stroke.
 *
 * Pointers are recorded in document coordinates while the brush is down.
 * last tracks how many pointers have already been rendered into the live
 * preview so each frame only renders what was added since.
 */
struct Brush {
    QColor color = QColor(255, 0, 0);
    qreal radius = 5.0;
    QVector<QPointF> pointers;
    bool down = false;
    int last = 0;
    BrushOptions options;

    static Brush create(const QColor& color, const BrushOptions& options,
                        const QVector<QPointF>& pointers = QVector<QPointF>());
};

/**
 * @brief Coordinate remapping used when rendering into the low resolution preview.
 */
struct BrushOverrides {
    qreal scale = 1.0;              ///< Document pixel -> preview pixel
    QPointF origin;                 ///< Document coordinate of the preview's top left
    QVector<QPointF> pointers;      ///< Pointers already mapped into preview space

    QPointF map(const QPointF& documentPoint) const {
        return (documentPoint - origin) * scale;
    }
};

/**
 * @brief Radius of the brush outline drawn at the cursor.
 */
inline qreal getSizeForBrush(const Brush& brush) { return brush.radius; }

/**
 * @brief The pointers to render in the current paint cycle.
 *
 * Returns everything recorded since the last rendered pointer, including that
 * pointer itself so consecutive segments connect.
 */
QVector<QPointF> slicePointers(const Brush& brush);

/**
 * @brief Rasterize a brush stroke.
 * @param painter Destination (already clipped / transformed by the caller).
 * @param brush Brush providing color, radius and (without overrides) the pointers.
 * @param overrides When set, its pointers and scale are used instead.
 * @param antiAlias Render with antialiasing.
 *
 * Strokes are drawn at full color alpha, the brush opacity is applied by the
 * caller when compositing the stroke so overlapping segments do not compound.
 */
void renderBrushStroke(QPainter& painter, const Brush& brush,
                       const BrushOverrides* overrides = nullptr, bool antiAlias = true);
