#include "policy.hpp"

namespace quasar
{

  namespace
  {

    class DirectedPolicy final : public TraversalPolicy
    {
    public:
      GraphMode mode() const override { return GraphMode::Directed; }

      RelKey key(const NodeId &source, const NodeId &target) const override
      {
        return RelKey{source, target};
      }

      std::optional<Direction> orientation(const Relationship &rel, const NodeId &from,
                                           Direction direction) const override
      {
        // a self-loop is reported once, as outgoing
        if ((direction == Direction::Out || direction == Direction::Both) && rel.source == from)
          return Direction::Out;
        if ((direction == Direction::In || direction == Direction::Both) && rel.target == from)
          return Direction::In;
        return std::nullopt;
      }
    };

    class UndirectedPolicy final : public TraversalPolicy
    {
    public:
      GraphMode mode() const override { return GraphMode::Undirected; }

      RelKey key(const NodeId &source, const NodeId &target) const override
      {
        if (target < source)
          return RelKey{target, source};
        return RelKey{source, target};
      }

      // direction is meaningless without edge direction
      std::optional<Direction> orientation(const Relationship &rel, const NodeId &from,
                                           Direction) const override
      {
        if (rel.source == from)
          return Direction::Out;
        if (rel.target == from)
          return Direction::In;
        return std::nullopt;
      }
    };

  } // namespace

  std::unique_ptr<TraversalPolicy> makeTraversalPolicy(GraphMode mode)
  {
    if (mode == GraphMode::Directed)
      return std::make_unique<DirectedPolicy>();
    return std::make_unique<UndirectedPolicy>();
  }

} // namespace quasar
