// Ticket: 0003_face_membership

#include "twisty-core/src/Collision/BoundsCollisionSystem.hpp"

#include <stdexcept>
#include <utility>

namespace twisty_core
{

BoundsCollisionSystem::BoundsCollisionSystem(
  const SceneGraph& scene,
  double colliderInset,
  std::shared_ptr<spdlog::logger> logger)
  : scene_{scene}, colliderInset_{colliderInset}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("BoundsCollisionSystem: null logger");
  }
}

std::set<NodeId> BoundsCollisionSystem::traverse(
  NodeId volume,
  const std::vector<NodeId>& population)
{
  BoundingBox const volumeBox = worldBoundsOf(volume, 0.0);

  std::set<NodeId> overlapping;
  for (NodeId cubie : population)
  {
    if (!colliderFor(cubie).intersects(volumeBox))
    {
      continue;
    }
    overlapping.insert(cubie);
    logger_->trace(
      " -- {}  ::  {}", scene_.name(volume), scene_.name(cubie));
    report(volume, cubie);
  }
  return overlapping;
}

void BoundsCollisionSystem::invalidate()
{
  cache_.clear();
}

const BoundingBox& BoundsCollisionSystem::colliderFor(NodeId cubie)
{
  uint64_t const revision = scene_.revision(cubie);
  auto it = cache_.find(cubie);
  if (it != cache_.end() && it->second.revision == revision)
  {
    return it->second.worldBox;
  }

  ++refreshCount_;
  auto result = cache_.insert_or_assign(
    cubie, CachedBounds{revision, worldBoundsOf(cubie, colliderInset_)});
  return result.first->second.worldBox;
}

BoundingBox BoundsCollisionSystem::worldBoundsOf(NodeId node,
                                                 double inset) const
{
  const auto& bounds = scene_.bounds(node);
  if (!bounds)
  {
    throw std::invalid_argument("BoundsCollisionSystem: node '" +
                                scene_.name(node) + "' has no bounds");
  }
  return bounds->shrunk(inset).transformed(scene_.worldFrame(node));
}

}  // namespace twisty_core
