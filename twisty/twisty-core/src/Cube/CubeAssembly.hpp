// Ticket: 0002_scene_hierarchy

#ifndef TWISTY_CORE_CUBE_ASSEMBLY_HPP
#define TWISTY_CORE_CUBE_ASSEMBLY_HPP

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "twisty-core/src/Scene/SceneGraph.hpp"

namespace twisty_core
{

/**
 * @brief Grid spacing and cubie size of the puzzle model
 */
struct CubeLayout
{
  double cubieSize{1.0};      // Edge length of one cubie
  double spacing{1.0};        // Distance between neighbouring cubie centers
  double volumeOverlap{0.1};  // Reach of a face volume into the next layer
};

/// Colour-family tags carried in cubie node names
inline constexpr std::array<std::string_view, 6> kColorTags{
  "WHITE", "YELLOW", "GREEN", "BLUE", "ORANGE", "RED"};

/// Tag carried by every face pivot node name
inline constexpr std::string_view kPivotTag{"SIDE"};

/**
 * @brief Builds the 3x3x3 puzzle into a scene graph and discovers its parts
 *
 * Scene layout (+X right, +Y away from the viewer, +Z up):
 * @code
 * render
 * └── cube
 *     ├── Cubie_WHITE_GREEN_ORANGE ... (26 cubies, core omitted)
 *     ├── TOP_SIDE
 *     │   └── TOP_SIDE_collider
 *     └── ... (9 pivots)
 * @endcode
 *
 * Cubies are named after the colour families of the faces they show: WHITE
 * (+Z), YELLOW (-Z), GREEN (-Y), BLUE (+Y), ORANGE (-X), RED (+X). Pivots sit
 * at the cube center with an identity transform; their collider child covers
 * the layer of cubie centers the face turns.
 */
class CubeAssembly
{
public:
  /**
   * @brief Populate @p scene with a solved cube under its root
   * @throws std::invalid_argument if the layout has a non-positive size or
   *         the cubies would overlap
   */
  CubeAssembly(SceneGraph& scene, const CubeLayout& layout = CubeLayout{});

  [[nodiscard]] NodeId cubeRoot() const
  {
    return cubeRoot_;
  }

  /**
   * @brief Every cubie node, ascending by id
   */
  [[nodiscard]] const std::vector<NodeId>& cubies() const
  {
    return cubies_;
  }

  /**
   * @brief Every face pivot node, ascending by id
   */
  [[nodiscard]] const std::vector<NodeId>& pivots() const
  {
    return pivots_;
  }

  [[nodiscard]] const CubeLayout& layout() const
  {
    return layout_;
  }

  /**
   * @brief Name a cubie at integer grid position (x, y, z), each in {-1, 0, 1}
   */
  static std::string cubieName(int x, int y, int z);

private:
  void buildCubies(SceneGraph& scene);
  void buildPivots(SceneGraph& scene);
  void discover(const SceneGraph& scene);

  CubeLayout layout_;
  NodeId cubeRoot_{0};
  std::vector<NodeId> cubies_;
  std::vector<NodeId> pivots_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_CUBE_ASSEMBLY_HPP
