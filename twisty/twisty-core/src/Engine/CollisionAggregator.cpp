// Ticket: 0003_face_membership

#include "twisty-core/src/Engine/CollisionAggregator.hpp"

namespace twisty_core
{

CollisionAggregator::CollisionAggregator(const FaceRegistry& registry)
  : registry_{registry}
{
}

void CollisionAggregator::report(FaceId face, NodeId cubie)
{
  sets_[toIndex(face)].insert(cubie);
}

bool CollisionAggregator::quorumReached(FaceId face) const
{
  return sets_[toIndex(face)].size() >= registry_.face(face).quorum;
}

void CollisionAggregator::clear(FaceId face)
{
  sets_[toIndex(face)].clear();
}

std::optional<FaceId> CollisionAggregator::firstQuorum() const
{
  for (FaceId const face : kAllFaces)
  {
    if (quorumReached(face))
    {
      return face;
    }
  }
  return std::nullopt;
}

}  // namespace twisty_core
