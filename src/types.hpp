#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quasar
{

  // null, bool, int64, uint64, double, string, array or object
  using Value = nlohmann::json;

  // caller-supplied; a string or an integer
  using NodeId = Value;

  // exported key names; attrs may not use them
  inline constexpr const char *kIdKey = "id";
  inline constexpr const char *kLabelsKey = "labels";
  inline constexpr const char *kSourceKey = "source";
  inline constexpr const char *kTargetKey = "target";
  inline constexpr const char *kTypeKey = "type";

  // -------------------- node / relationship data ---------------------------

  struct Node
  {
    NodeId id{};
    std::vector<std::string> labels{}; // insertion order, no duplicates
    Value attrs = Value::object();
  };

  struct Relationship
  {
    NodeId source{};
    NodeId target{};
    std::optional<std::string> type{};
    Value attrs = Value::object();
  };

  // storage key of a relationship, canonicalized by the traversal policy
  using RelKey = std::pair<NodeId, NodeId>;

  enum class Direction : uint8_t
  {
    Out = 0,
    In = 1,
    Both = 2
  };

  enum class GraphMode : uint8_t
  {
    Undirected = 0,
    Directed = 1
  };

  // -------------------- adjacency ---------------------------

  // rel points into the owning Store; valid until its next mutation
  struct Adjacency
  {
    NodeId neighborId{};
    const Relationship *rel{nullptr};
    Direction direction{Direction::Out};
  };

  // -------------------- params / results ---------------------------

  struct AddNodeParams
  {
    NodeId id{};
    std::vector<std::string> labels{};
    Value attrs = Value::object();
  };

  struct SetNodeParams
  {
    NodeId id{};
    std::optional<std::vector<std::string>> labels{}; // keep current labels when unset
    Value attrs = Value::object();                    // merge patch
  };

  struct UpdateNodeParams
  {
    NodeId id{};
    std::optional<std::vector<std::string>> labels{};
    Value attrs = Value::object(); // merge patch
  };

  struct SetNodeLabelsParams
  {
    NodeId id{};
    std::vector<std::string> addLabels{};
    std::vector<std::string> removeLabels{};
  };

  struct AddRelationshipParams
  {
    NodeId source{};
    NodeId target{};
    std::optional<std::string> type{};
    Value attrs = Value::object();
  };

  struct SetRelationshipParams
  {
    NodeId source{};
    NodeId target{};
    std::optional<std::string> type{}; // keep current type when unset
    Value attrs = Value::object();     // merge patch
  };

  struct UpdateRelationshipParams
  {
    NodeId source{};
    NodeId target{};
    std::optional<std::string> type{};
    Value attrs = Value::object(); // merge patch
  };

  // detached query results; props is the exported (and possibly projected) mapping
  struct NodeMatch
  {
    NodeId id{};
    Value props = Value::object();
  };

  struct RelationshipMatch
  {
    NodeId source{};
    NodeId target{};
    Value props = Value::object();
  };

} // namespace quasar
