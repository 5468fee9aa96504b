#pragma once
#include "condition.hpp"
#include "store.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace quasar
{

  // -------------------- pattern ---------------------------

  enum class TypeFilterKind : uint8_t
  {
    Any = 0,     // typed and untyped relationships
    Untyped = 1, // only relationships without a type
    Named = 2
  };

  struct TypeFilter
  {
    TypeFilterKind kind{TypeFilterKind::Any};
    std::string name{};

    static TypeFilter any() { return TypeFilter{}; }
    static TypeFilter untyped() { return TypeFilter{TypeFilterKind::Untyped, {}}; }
    static TypeFilter named(std::string name) { return TypeFilter{TypeFilterKind::Named, std::move(name)}; }

    bool accepts(const Relationship &rel) const;
  };

  struct PatternStep
  {
    TypeFilter relType{};
    std::optional<std::string> label{};
    Condition node{};
  };

  struct MatchParams
  {
    Condition start{};
    std::optional<std::string> startLabel{};
    std::vector<PatternStep> pattern{};
    Direction direction{Direction::Out}; // ignored by undirected graphs
    std::vector<std::string> nodeFields{};
    std::vector<std::string> relFields{};
  };

  // -------------------- results ---------------------------

  // k steps -> k+1 nodes and k relationships
  struct Path
  {
    std::vector<NodeMatch> nodes;
    std::vector<RelationshipMatch> relationships;
  };

  // node, relationship, node, ... relationship, node
  using PathElement = std::variant<NodeMatch, RelationshipMatch>;
  using StructuredPath = std::vector<PathElement>;

  // {"id", "labels", "properties"} / {"source", "target", "type", "properties"} objects;
  // "labels" and "type" appear when the (projected) mapping carries them
  Value toJson(const StructuredPath &path);

  // -------------------- json front-end ---------------------------

  // "out", "in" or "any"
  Direction parseDirection(std::string_view token);

  // [{"rel_type": "KNOWS"|null, "label": "Person", "node": {...}}, ...]
  // an absent rel_type matches any type; null matches only untyped relationships
  std::vector<PatternStep> parsePattern(const Value &doc);

  // -------------------- matcher ---------------------------

  // Enumerates the paths that start at a node satisfying `start` and take one
  // relationship per pattern step. Frontiers are pruned eagerly; nodes and
  // relationships may repeat within a path.
  class Matcher
  {
  public:
    explicit Matcher(const Store &s) : store_(s) {}

    std::vector<std::vector<NodeMatch>> matchNodes(const MatchParams &params) const;
    std::vector<std::vector<NodeId>> matchNodeIds(const MatchParams &params) const;
    std::vector<Path> matchPaths(const MatchParams &params) const;
    std::vector<StructuredPath> matchStructured(const MatchParams &params) const;

  private:
    // borrowed from the store for the duration of one call
    struct Trail
    {
      std::vector<const Node *> nodes;
      std::vector<const Relationship *> rels;
    };

    std::vector<Trail> traverse(const MatchParams &params) const;
    std::vector<Trail> expand(const std::vector<Trail> &frontier, const PatternStep &step, Direction direction) const;

    const Store &store_;
  };

} // namespace quasar
