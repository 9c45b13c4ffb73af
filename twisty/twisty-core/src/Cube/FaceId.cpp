#include "twisty-core/src/Cube/FaceId.hpp"

namespace twisty_core
{

std::string_view toString(FaceId face)
{
  switch (face)
  {
    case FaceId::Top:
      return "TOP";
    case FaceId::Bottom:
      return "BOTTOM";
    case FaceId::Left:
      return "LEFT";
    case FaceId::Right:
      return "RIGHT";
    case FaceId::Front:
      return "FRONT";
    case FaceId::Back:
      return "BACK";
    case FaceId::CenterVertical:
      return "CENTER_VERTICAL";
    case FaceId::CenterHorizontal:
      return "CENTER_HORIZONTAL";
    case FaceId::CenterDouble:
      return "CENTER_DOUBLE";
  }
  return "UNKNOWN";
}

}  // namespace twisty_core
