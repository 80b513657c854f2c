#include "ToolType.h"
#include "Layer.h"

bool canDrawOnSelection(const Layer& layer)
{
    return layer.type == LayerType::Graphic || layer.hasMask();
}
