#pragma once
#include "types.hpp"
#include <memory>
#include <optional>

namespace quasar
{

  // Directed/undirected behaviour of a graph. Selected once when the Store is
  // constructed and consulted for relationship keying, adjacency, degree and
  // pattern expansion.
  class TraversalPolicy
  {
  public:
    virtual ~TraversalPolicy() = default;

    virtual GraphMode mode() const = 0;

    // Storage key of the relationship between source and target. Undirected
    // graphs map (a,b) and (b,a) to the same key.
    virtual RelKey key(const NodeId &source, const NodeId &target) const = 0;

    // Orientation in which rel can be traversed away from `from` when moving
    // in `direction`, or nullopt when it cannot. Out means `from` is the
    // stored source and the neighbour is the target; In the reverse.
    virtual std::optional<Direction> orientation(const Relationship &rel, const NodeId &from,
                                                 Direction direction) const = 0;
  };

  std::unique_ptr<TraversalPolicy> makeTraversalPolicy(GraphMode mode);

  inline const NodeId &neighborOf(const Relationship &rel, Direction orientation)
  {
    return orientation == Direction::In ? rel.source : rel.target;
  }

} // namespace quasar
