// Ticket: 0003_face_membership

#ifndef TWISTY_CORE_COLLISION_AGGREGATOR_HPP
#define TWISTY_CORE_COLLISION_AGGREGATOR_HPP

#include <array>
#include <optional>
#include <set>

#include "twisty-core/src/Cube/FaceRegistry.hpp"

namespace twisty_core
{

/**
 * @brief Per-face sets of cubies reported touching the face's volume
 *
 * Sets only grow through report() and only shrink through clear(). Repeated
 * reports of the same cubie are idempotent. Reaching quorum triggers
 * nothing on its own; the caller decides when to rotate.
 *
 * Thread safety: Not thread-safe
 */
class CollisionAggregator
{
public:
  /**
   * @param registry Source of each face's quorum (non-owning)
   */
  explicit CollisionAggregator(const FaceRegistry& registry);

  void report(FaceId face, NodeId cubie);

  /**
   * @brief True once the set holds at least the face's quorum
   */
  [[nodiscard]] bool quorumReached(FaceId face) const;

  void clear(FaceId face);

  [[nodiscard]] const std::set<NodeId>& members(FaceId face) const
  {
    return sets_[toIndex(face)];
  }

  [[nodiscard]] size_t size(FaceId face) const
  {
    return sets_[toIndex(face)].size();
  }

  /**
   * @brief First face, in FaceId declaration order, whose quorum is reached
   */
  [[nodiscard]] std::optional<FaceId> firstQuorum() const;

private:
  const FaceRegistry& registry_;
  std::array<std::set<NodeId>, kFaceCount> sets_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_COLLISION_AGGREGATOR_HPP
