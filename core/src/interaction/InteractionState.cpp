#include "ck/interaction/InteractionState.hpp"

namespace ck {

const char* interactionKindName(InteractionKind kind) {
  switch (kind) {
    case InteractionKind::None:         return "none";
    case InteractionKind::Panning:      return "panning";
    case InteractionKind::Scaling:      return "scaling";
    case InteractionKind::Pinching:     return "pinching";
    case InteractionKind::Drawing:      return "drawing";
    case InteractionKind::Aiming:       return "aiming";
    case InteractionKind::Moving:       return "moving";
    case InteractionKind::Resizing:     return "resizing";
    case InteractionKind::Crosshair:    return "crosshair";
    case InteractionKind::DraggingLine: return "draggingLine";
  }
  return "none";
}

} // namespace ck
