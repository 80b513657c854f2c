#pragma once

// ============================================================================
// ToolType - Available layer editing tools
// ============================================================================
// Tools form a closed set. LayerSprite dispatches on the tool with a switch,
// there are no per-tool subclasses.
// ============================================================================

class Layer;

/**
 * @brief Available layer editing tools.
 */
enum class ToolType {
    None,       ///< No tool armed
    Drag,       ///< Reposition the layer (or its mask when the mask is the action target)
    Brush,      ///< Freehand painting
    Eraser,     ///< Freehand erasing (destination-out)
    Clone,      ///< Clone stamp: paint pixels read from a source anchor
    Fill,       ///< Bucket fill (instant, no stroke phase)
    Eyedropper  ///< Pick the color under the cursor
};

/**
 * @brief Which of a layer's buffers receives paint operations.
 */
enum class ActionTarget {
    Source,     ///< The layer's primary raster
    Mask        ///< The layer's mask raster
};

/**
 * @brief Tools that write pixels through the stroke-paint procedure.
 */
inline bool isDrawingTool(ToolType tool)
{
    switch (tool) {
        case ToolType::Brush:
        case ToolType::Eraser:
        case ToolType::Clone:
        case ToolType::Fill:
            return true;
        case ToolType::None:
        case ToolType::Drag:
        case ToolType::Eyedropper:
            break;
    }
    return false;
}

/**
 * @brief Whether drawing tools may work alongside a selection on this layer.
 *
 * Graphic layers can be painted within a selection, and so can any layer
 * that has a mask (the mask itself is painted).
 */
bool canDrawOnSelection(const Layer& layer);
