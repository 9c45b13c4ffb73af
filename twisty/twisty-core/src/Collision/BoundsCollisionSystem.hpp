// Ticket: 0003_face_membership

#ifndef TWISTY_CORE_BOUNDS_COLLISION_SYSTEM_HPP
#define TWISTY_CORE_BOUNDS_COLLISION_SYSTEM_HPP

#include <cstdint>
#include <memory>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "twisty-core/src/Collision/CollisionSystem.hpp"
#include "twisty-core/src/Scene/BoundingBox.hpp"
#include "twisty-core/src/Scene/SceneGraph.hpp"

namespace twisty_core
{

/**
 * @brief Collision subsystem testing world-space bounding boxes
 *
 * Face volumes reach slightly into the neighbouring layers and use their
 * tight bounds unchanged. A cubie's collider is its tight bounds shrunk by a
 * fixed inset; with an inset larger than that reach, a cubie only touches
 * the volumes of the layers it actually sits in.
 *
 * Cubie world boxes are cached and refreshed only when the cubie's own
 * revision changes. A cubie carried by a moving ancestor keeps its old box
 * until it is moved directly or invalidate() is called.
 *
 * Thread safety: Not thread-safe
 */
class BoundsCollisionSystem : public CollisionSystem
{
public:
  /**
   * @brief Construct over a scene
   * @param scene Scene graph (non-owning, must outlive this object)
   * @param colliderInset Inset applied to every cubie's tight bounds
   * @param logger Logger for per-overlap trace output
   */
  BoundsCollisionSystem(const SceneGraph& scene,
                        double colliderInset,
                        std::shared_ptr<spdlog::logger> logger);

  std::set<NodeId> traverse(NodeId volume,
                            const std::vector<NodeId>& population) override;

  void invalidate() override;

  /**
   * @brief Number of cubie boxes currently cached
   */
  [[nodiscard]] size_t cachedCount() const
  {
    return cache_.size();
  }

  /**
   * @brief Number of cubie boxes recomputed since construction
   */
  [[nodiscard]] uint64_t refreshCount() const
  {
    return refreshCount_;
  }

private:
  struct CachedBounds
  {
    uint64_t revision;
    BoundingBox worldBox;
  };

  /// @brief World collider of a cubie, from cache when its revision matches
  const BoundingBox& colliderFor(NodeId cubie);

  [[nodiscard]] BoundingBox worldBoundsOf(NodeId node, double inset) const;

  const SceneGraph& scene_;
  double colliderInset_;
  std::shared_ptr<spdlog::logger> logger_;
  std::unordered_map<NodeId, CachedBounds> cache_;
  uint64_t refreshCount_{0};
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_BOUNDS_COLLISION_SYSTEM_HPP
