#include "twisty-core/src/Engine/EngineConfig.hpp"

#include <format>
#include <stdexcept>

namespace twisty_core
{

void EngineConfig::validate() const
{
  if (animation.rotationDuration.count() < 0)
  {
    throw std::invalid_argument("EngineConfig: rotation duration is negative");
  }

  if (shuffle.minMoves == 0 || shuffle.minMoves > shuffle.maxMoves)
  {
    throw std::invalid_argument(
      std::format("EngineConfig: invalid shuffle move range [{}, {}]",
                  shuffle.minMoves,
                  shuffle.maxMoves));
  }
  if (shuffle.leadIn.count() < 0 || shuffle.moveInterval.count() < 0)
  {
    throw std::invalid_argument("EngineConfig: shuffle delays are negative");
  }

  if (collision.refresh == MembershipRefresh::Perturb &&
      collision.perturbationOffset == 0.0)
  {
    throw std::invalid_argument(
      "EngineConfig: perturbation offset must be non-zero");
  }

  if (layout.cubieSize <= 0.0 || layout.spacing <= 0.0)
  {
    throw std::invalid_argument(
      "EngineConfig: cubie size and spacing must be positive");
  }
  if (collision.colliderInset < 0.0 ||
      2.0 * collision.colliderInset >= layout.cubieSize)
  {
    throw std::invalid_argument(std::format(
      "EngineConfig: collider inset {} does not fit cubie size {}",
      collision.colliderInset,
      layout.cubieSize));
  }
  if (layout.volumeOverlap < 0.0 ||
      collision.colliderInset <= layout.volumeOverlap)
  {
    throw std::invalid_argument(std::format(
      "EngineConfig: collider inset {} must exceed face volume overlap {}",
      collision.colliderInset,
      layout.volumeOverlap));
  }
}

}  // namespace twisty_core
