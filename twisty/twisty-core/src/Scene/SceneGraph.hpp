// Ticket: 0002_scene_hierarchy

#ifndef TWISTY_CORE_SCENE_GRAPH_HPP
#define TWISTY_CORE_SCENE_GRAPH_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "twisty-core/src/Scene/BoundingBox.hpp"
#include "twisty-core/src/Scene/ReferenceFrame.hpp"

namespace twisty_core
{

using NodeId = uint32_t;

/**
 * @brief Transform hierarchy for the puzzle scene
 *
 * Every node has exactly one parent (except the root), a local transform
 * relative to that parent, and optionally the tight bounds of its geometry in
 * node-local coordinates. Nodes are never destroyed, so a NodeId stays valid
 * for the lifetime of the graph.
 *
 * Each node carries a revision counter that is bumped whenever its own local
 * transform or its parent changes. Motion inherited from an ancestor does not
 * bump the revision; consumers that cache world-space data keyed on the
 * revision can therefore go stale when an ancestor moves.
 *
 * Thread safety: Not thread-safe
 */
class SceneGraph
{
public:
  /**
   * @brief Construct a graph containing only the root node
   * @param rootName Name of the root node
   */
  explicit SceneGraph(std::string rootName = "render");

  [[nodiscard]] NodeId root() const
  {
    return 0;
  }

  /**
   * @brief Create a node under @p parent
   * @param name Node name (need not be unique)
   * @param parent Parent node
   * @param local Transform relative to the parent
   * @param bounds Tight bounds of the node's geometry in local coordinates
   * @return Id of the new node
   * @throws std::out_of_range if @p parent does not exist
   */
  NodeId createNode(std::string name,
                    NodeId parent,
                    const ReferenceFrame& local = ReferenceFrame{},
                    std::optional<BoundingBox> bounds = std::nullopt);

  /**
   * @brief Move @p node under @p newParent
   * @param node Node to move
   * @param newParent New parent node
   * @param preserveWorldTransform If true the local transform is recomputed
   *        so the node does not move in world space; if false the local
   *        transform is kept and the node moves with its new parent.
   * @throws std::invalid_argument if @p newParent is @p node or one of its
   *         descendants, or if @p node is the root
   */
  void reparent(NodeId node, NodeId newParent, bool preserveWorldTransform);

  /**
   * @brief Replace the local transform of a node
   */
  void setTransform(NodeId node, const ReferenceFrame& local);

  /**
   * @brief Reset the local transform of a node to identity
   */
  void clearTransform(NodeId node);

  /**
   * @brief Offset the local origin of a node (in parent coordinates)
   */
  void translate(NodeId node, const Coordinate& offset);

  [[nodiscard]] const ReferenceFrame& localFrame(NodeId node) const;

  /**
   * @brief Transform from node-local coordinates to world coordinates
   */
  [[nodiscard]] ReferenceFrame worldFrame(NodeId node) const;

  [[nodiscard]] NodeId parent(NodeId node) const;

  [[nodiscard]] const std::vector<NodeId>& children(NodeId node) const;

  [[nodiscard]] const std::string& name(NodeId node) const;

  [[nodiscard]] const std::optional<BoundingBox>& bounds(NodeId node) const;

  [[nodiscard]] uint64_t revision(NodeId node) const;

  /**
   * @brief True if @p ancestor is @p node or lies on its parent chain
   */
  [[nodiscard]] bool isAncestor(NodeId ancestor, NodeId node) const;

  /**
   * @brief First node (in creation order) with exactly this name
   */
  [[nodiscard]] std::optional<NodeId> find(std::string_view name) const;

  /**
   * @brief All nodes whose name contains @p tag, in creation order
   */
  [[nodiscard]] std::vector<NodeId> findAll(std::string_view tag) const;

  [[nodiscard]] bool contains(NodeId node) const
  {
    return node < nodes_.size();
  }

  [[nodiscard]] size_t size() const
  {
    return nodes_.size();
  }

  /**
   * @brief Indented listing of the hierarchy with world positions
   */
  [[nodiscard]] std::string describe() const;

private:
  struct Node
  {
    std::string name;
    NodeId parent{0};
    std::vector<NodeId> children;
    ReferenceFrame local;
    std::optional<BoundingBox> bounds;
    uint64_t revision{0};
  };

  Node& at(NodeId node);
  const Node& at(NodeId node) const;

  void detach(NodeId node);

  void describeNode(NodeId node, int depth, std::string& out) const;

  std::vector<Node> nodes_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_SCENE_GRAPH_HPP
