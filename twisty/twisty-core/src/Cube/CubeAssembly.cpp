// Ticket: 0002_scene_hierarchy

#include "twisty-core/src/Cube/CubeAssembly.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace twisty_core
{

namespace
{

struct PivotLayer
{
  std::string_view name;
  int axis;   // 0 = x, 1 = y, 2 = z
  int layer;  // Grid coordinate of the layer along the axis
};

constexpr std::array<PivotLayer, 9> kPivotLayers{{{"TOP_SIDE", 2, 1},
                                                  {"BOTTOM_SIDE", 2, -1},
                                                  {"LEFT_SIDE", 0, -1},
                                                  {"RIGHT_SIDE", 0, 1},
                                                  {"FRONT_SIDE", 1, -1},
                                                  {"BACK_SIDE", 1, 1},
                                                  {"CENTER_VERTICAL_SIDE", 2, 0},
                                                  {"CENTER_HORIZONTAL_SIDE", 0, 0},
                                                  {"CENTER_DOUBLE_SIDE", 1, 0}}};

}  // namespace

CubeAssembly::CubeAssembly(SceneGraph& scene, const CubeLayout& layout)
  : layout_{layout}
{
  if (layout_.cubieSize <= 0.0 || layout_.spacing <= 0.0)
  {
    throw std::invalid_argument(
      "CubeAssembly: cubie size and spacing must be positive");
  }
  if (layout_.cubieSize > layout_.spacing)
  {
    throw std::invalid_argument(std::format(
      "CubeAssembly: cubie size {} exceeds spacing {}",
      layout_.cubieSize,
      layout_.spacing));
  }
  if (layout_.volumeOverlap < 0.0)
  {
    throw std::invalid_argument("CubeAssembly: volume overlap is negative");
  }

  cubeRoot_ = scene.createNode("cube", scene.root());
  buildCubies(scene);
  buildPivots(scene);
  discover(scene);
}

std::string CubeAssembly::cubieName(int x, int y, int z)
{
  std::string name{"Cubie"};
  if (z != 0)
  {
    name += z > 0 ? "_WHITE" : "_YELLOW";
  }
  if (y != 0)
  {
    name += y > 0 ? "_BLUE" : "_GREEN";
  }
  if (x != 0)
  {
    name += x > 0 ? "_RED" : "_ORANGE";
  }
  return name;
}

void CubeAssembly::buildCubies(SceneGraph& scene)
{
  double const half = 0.5 * layout_.cubieSize;
  auto const localBounds =
    BoundingBox::fromCenter(Coordinate{}, Coordinate{half, half, half});

  for (int z = 1; z >= -1; --z)
  {
    for (int y = -1; y <= 1; ++y)
    {
      for (int x = -1; x <= 1; ++x)
      {
        if (x == 0 && y == 0 && z == 0)
        {
          continue;
        }
        Coordinate const position{x * layout_.spacing,
                                  y * layout_.spacing,
                                  z * layout_.spacing};
        scene.createNode(cubieName(x, y, z),
                         cubeRoot_,
                         ReferenceFrame{position},
                         localBounds);
      }
    }
  }
}

void CubeAssembly::buildPivots(SceneGraph& scene)
{
  // Each collider spans the whole cube across the layer. Along the turning
  // axis it covers the layer's cubies and reaches volumeOverlap into the
  // neighbouring layers, like a face model's tight bounds would.
  double const extent = 1.5 * layout_.spacing;
  double const half =
    layout_.spacing - 0.5 * layout_.cubieSize + layout_.volumeOverlap;

  for (const auto& entry : kPivotLayers)
  {
    Coordinate center{0.0, 0.0, 0.0};
    Coordinate halfExtents{extent, extent, extent};
    center[entry.axis] = entry.layer * layout_.spacing;
    halfExtents[entry.axis] = half;

    std::string const pivotName{entry.name};
    NodeId const pivot = scene.createNode(pivotName, cubeRoot_);
    scene.createNode(pivotName + "_collider",
                     pivot,
                     ReferenceFrame{},
                     BoundingBox::fromCenter(center, halfExtents));
  }
}

void CubeAssembly::discover(const SceneGraph& scene)
{
  for (const auto tag : kColorTags)
  {
    auto const tagged = scene.findAll(tag);
    cubies_.insert(cubies_.end(), tagged.begin(), tagged.end());
  }
  std::ranges::sort(cubies_);
  auto const duplicates = std::ranges::unique(cubies_);
  cubies_.erase(duplicates.begin(), duplicates.end());

  for (NodeId const node : scene.findAll(kPivotTag))
  {
    if (scene.parent(node) == cubeRoot_)
    {
      pivots_.push_back(node);
    }
  }
}

}  // namespace twisty_core
