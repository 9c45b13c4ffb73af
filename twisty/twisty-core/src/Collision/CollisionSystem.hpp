#ifndef TWISTY_CORE_COLLISION_SYSTEM_HPP
#define TWISTY_CORE_COLLISION_SYSTEM_HPP

#include <functional>
#include <set>
#include <utility>
#include <vector>

#include "twisty-core/src/Scene/SceneGraph.hpp"

namespace twisty_core
{

/**
 * @brief Spatial collision subsystem consulted for face membership
 *
 * A traversal tests one collision volume against a population of cubie nodes.
 * Every detected overlap is returned and also routed through the report hook,
 * in no particular order.
 */
class CollisionSystem
{
public:
  using ReportHook = std::function<void(NodeId volume, NodeId cubie)>;

  virtual ~CollisionSystem() = default;

  /**
   * @brief Test a volume against a cubie population
   * @param volume Node carrying the collision volume
   * @param population Cubie nodes to test
   * @return Cubies overlapping the volume
   */
  virtual std::set<NodeId> traverse(NodeId volume,
                                    const std::vector<NodeId>& population) = 0;

  /**
   * @brief Drop any cached spatial data so the next traversal reflects the
   * current scene exactly
   */
  virtual void invalidate() = 0;

  void setReportHook(ReportHook hook)
  {
    reportHook_ = std::move(hook);
  }

protected:
  void report(NodeId volume, NodeId cubie) const
  {
    if (reportHook_)
    {
      reportHook_(volume, cubie);
    }
  }

private:
  ReportHook reportHook_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_COLLISION_SYSTEM_HPP
