// Ticket: 0002_scene_hierarchy

#include "twisty-core/src/Scene/SceneGraph.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <stdexcept>

namespace twisty_core
{

SceneGraph::SceneGraph(std::string rootName)
{
  nodes_.push_back(Node{.name = std::move(rootName)});
}

NodeId SceneGraph::createNode(std::string name,
                              NodeId parent,
                              const ReferenceFrame& local,
                              std::optional<BoundingBox> bounds)
{
  at(parent);  // validates parent

  auto const id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(Node{.name = std::move(name),
                        .parent = parent,
                        .children = {},
                        .local = local,
                        .bounds = std::move(bounds),
                        .revision = 0});
  at(parent).children.push_back(id);
  return id;
}

void SceneGraph::reparent(NodeId node,
                          NodeId newParent,
                          bool preserveWorldTransform)
{
  at(node);
  at(newParent);

  if (node == root())
  {
    throw std::invalid_argument("SceneGraph: cannot reparent the root node");
  }
  if (isAncestor(node, newParent))
  {
    throw std::invalid_argument(
      std::format("SceneGraph: cannot reparent '{}' under itself or a "
                  "descendant ('{}')",
                  at(node).name,
                  at(newParent).name));
  }

  if (preserveWorldTransform)
  {
    ReferenceFrame const world = worldFrame(node);
    at(node).local = worldFrame(newParent).inverse() * world;
  }

  detach(node);
  at(node).parent = newParent;
  at(newParent).children.push_back(node);
  ++at(node).revision;
}

void SceneGraph::setTransform(NodeId node, const ReferenceFrame& local)
{
  Node& n = at(node);
  n.local = local;
  ++n.revision;
}

void SceneGraph::clearTransform(NodeId node)
{
  setTransform(node, ReferenceFrame{});
}

void SceneGraph::translate(NodeId node, const Coordinate& offset)
{
  Node& n = at(node);
  n.local.setOrigin(Coordinate{n.local.getOrigin() + offset});
  ++n.revision;
}

const ReferenceFrame& SceneGraph::localFrame(NodeId node) const
{
  return at(node).local;
}

ReferenceFrame SceneGraph::worldFrame(NodeId node) const
{
  ReferenceFrame world = at(node).local;
  NodeId current = node;
  while (current != root())
  {
    current = at(current).parent;
    world = at(current).local * world;
  }
  return world;
}

NodeId SceneGraph::parent(NodeId node) const
{
  return at(node).parent;
}

const std::vector<NodeId>& SceneGraph::children(NodeId node) const
{
  return at(node).children;
}

const std::string& SceneGraph::name(NodeId node) const
{
  return at(node).name;
}

const std::optional<BoundingBox>& SceneGraph::bounds(NodeId node) const
{
  return at(node).bounds;
}

uint64_t SceneGraph::revision(NodeId node) const
{
  return at(node).revision;
}

bool SceneGraph::isAncestor(NodeId ancestor, NodeId node) const
{
  at(ancestor);
  NodeId current = node;
  while (true)
  {
    if (current == ancestor)
    {
      return true;
    }
    if (current == root())
    {
      return false;
    }
    current = at(current).parent;
  }
}

std::optional<NodeId> SceneGraph::find(std::string_view name) const
{
  auto it = std::ranges::find_if(nodes_,
                                 [name](const Node& n)
                                 { return n.name == name; });
  if (it == nodes_.end())
  {
    return std::nullopt;
  }
  return static_cast<NodeId>(std::distance(nodes_.begin(), it));
}

std::vector<NodeId> SceneGraph::findAll(std::string_view tag) const
{
  std::vector<NodeId> matches;
  for (NodeId id = 0; id < nodes_.size(); ++id)
  {
    if (nodes_[id].name.find(tag) != std::string::npos)
    {
      matches.push_back(id);
    }
  }
  return matches;
}

std::string SceneGraph::describe() const
{
  std::string out;
  describeNode(root(), 0, out);
  return out;
}

SceneGraph::Node& SceneGraph::at(NodeId node)
{
  if (!contains(node))
  {
    throw std::out_of_range(std::format("SceneGraph: unknown node {}", node));
  }
  return nodes_[node];
}

const SceneGraph::Node& SceneGraph::at(NodeId node) const
{
  if (!contains(node))
  {
    throw std::out_of_range(std::format("SceneGraph: unknown node {}", node));
  }
  return nodes_[node];
}

void SceneGraph::detach(NodeId node)
{
  auto& siblings = at(at(node).parent).children;
  std::erase(siblings, node);
}

void SceneGraph::describeNode(NodeId node, int depth, std::string& out) const
{
  out += std::format("{:{}}{} {}\n",
                     "",
                     depth * 2,
                     at(node).name,
                     worldFrame(node).getOrigin());
  for (NodeId child : at(node).children)
  {
    describeNode(child, depth + 1, out);
  }
}

}  // namespace twisty_core
