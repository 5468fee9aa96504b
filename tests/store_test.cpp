#include "store.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

using quasar::Direction;
using quasar::NodeId;
using quasar::Value;

namespace
{

  std::vector<NodeId> idsOf(const std::vector<quasar::NodeMatch> &rows)
  {
    std::vector<NodeId> out;
    for (const auto &r : rows)
      out.push_back(r.id);
    return out;
  }

  bool contains(const std::vector<NodeId> &ids, const NodeId &id)
  {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
  }

} // namespace

// A -FRIEND_OF-> B -LIVES_IN-> C
class DirectedStoreTest : public ::testing::Test
{
protected:
  quasar::Env env{};
  quasar::Store store{env, quasar::GraphMode::Directed};

  void SetUp() override
  {
    store.addNode({.id = "A", .labels = {"Person"}, .attrs = {{"name", "Alice"}, {"age", 30}}});
    store.addNode({.id = "B", .labels = {"Person"}, .attrs = {{"name", "Bob"}, {"age", 25}}});
    store.addNode({.id = "C", .labels = {"City"}, .attrs = {{"name", "Cairo"}}});
    store.addRelationship({.source = "A", .target = "B", .type = "FRIEND_OF", .attrs = {{"since", 2010}}});
    store.addRelationship({.source = "B", .target = "C", .type = "LIVES_IN"});
  }
};

class UndirectedStoreTest : public ::testing::Test
{
protected:
  quasar::Env env{};
  quasar::Store store{env};

  void SetUp() override
  {
    store.addNode({.id = "A"});
    store.addNode({.id = "B"});
    store.addNode({.id = "C"});
    store.addRelationship({.source = "A", .target = "B", .type = "FRIEND_OF"});
  }
};

// -------------------- node writes ---------------------------

TEST_F(DirectedStoreTest, AddNodeReplacesWholesale)
{
  store.addNode({.id = "A", .labels = {"Admin"}, .attrs = {{"nick", "Al"}}});

  auto props = store.getNode("A").props;
  EXPECT_EQ(props["labels"], Value::array({"Admin"}));
  EXPECT_EQ(props["nick"], "Al");
  EXPECT_FALSE(props.contains("name"));
  EXPECT_EQ(store.nodeCount(), 3u);
}

TEST_F(DirectedStoreTest, AddingSameNodeTwiceIsIdempotent)
{
  Value before = quasar::encodeGraph(store);
  store.addNode({.id = "A", .labels = {"Person"}, .attrs = {{"name", "Alice"}, {"age", 30}}});
  EXPECT_EQ(quasar::encodeGraph(store), before);
}

TEST_F(DirectedStoreTest, DuplicateLabelsAreStoredOnce)
{
  store.addNode({.id = "D", .labels = {"X", "Y", "X"}});
  EXPECT_EQ(store.getNode("D").props["labels"], Value::array({"X", "Y"}));
}

TEST_F(DirectedStoreTest, IntegerAndStringIdsAreDistinct)
{
  store.addNode({.id = 1});
  store.addNode({.id = "1"});
  EXPECT_EQ(store.nodeCount(), 5u);
  EXPECT_TRUE(store.hasNode(1));
  EXPECT_TRUE(store.hasNode("1"));
}

TEST_F(DirectedStoreTest, InvalidIdKindIsRejected)
{
  EXPECT_THROW(store.addNode({.id = 1.5}), quasar::ValidationError);
  EXPECT_THROW(store.addNode({.id = Value::array()}), quasar::ValidationError);
  EXPECT_THROW(store.addNode({.id = nullptr}), quasar::ValidationError);
  EXPECT_THROW(store.setNode({.id = true}), quasar::ValidationError);
  EXPECT_EQ(store.nodeCount(), 3u);
}

TEST_F(DirectedStoreTest, ReservedAttributeKeysAreRejected)
{
  Value labelsAttr = {{"labels", "oops"}};
  Value idAttr = {{"id", "oops"}};
  Value typeAttr = {{"type", "oops"}};
  Value sourceAttr = {{"source", "oops"}};

  EXPECT_THROW(store.addNode({.id = "D", .attrs = labelsAttr}), quasar::ValidationError);
  EXPECT_THROW(store.updateNode({.id = "A", .attrs = idAttr}), quasar::ValidationError);
  EXPECT_THROW(store.addRelationship({.source = "A", .target = "C", .attrs = typeAttr}), quasar::ValidationError);
  EXPECT_THROW(store.setRelationship({.source = "A", .target = "B", .attrs = sourceAttr}), quasar::ValidationError);

  EXPECT_FALSE(store.hasNode("D"));
  EXPECT_FALSE(store.hasRelationship("A", "C"));
  EXPECT_EQ(store.getNode("A").props["name"], "Alice");
}

TEST_F(DirectedStoreTest, NonObjectAttributesAreRejected)
{
  EXPECT_THROW(store.addNode({.id = "D", .attrs = 5}), quasar::ValidationError);
  EXPECT_FALSE(store.hasNode("D"));
}

TEST_F(DirectedStoreTest, SetNodeCreatesThenMerges)
{
  store.setNode({.id = "D", .attrs = {{"x", 1}}});
  ASSERT_TRUE(store.hasNode("D"));
  EXPECT_EQ(store.getNode("D").props["labels"], Value::array());

  store.setNode({.id = "D", .labels = std::vector<std::string>{"L"}, .attrs = {{"y", 2}}});
  auto props = store.getNode("D").props;
  EXPECT_EQ(props["x"], 1);
  EXPECT_EQ(props["y"], 2);
  EXPECT_EQ(props["labels"], Value::array({"L"}));

  // labels survive a set without labels
  store.setNode({.id = "D", .attrs = {{"z", 3}}});
  EXPECT_EQ(store.getNode("D").props["labels"], Value::array({"L"}));
}

TEST_F(DirectedStoreTest, UpdateNodeMergesAndFailsWhenAbsent)
{
  store.updateNode({.id = "A", .attrs = {{"age", 31}, {"city", "Paris"}}});
  auto props = store.getNode("A").props;
  EXPECT_EQ(props["age"], 31);
  EXPECT_EQ(props["city"], "Paris");
  EXPECT_EQ(props["name"], "Alice");
  EXPECT_EQ(props["labels"], Value::array({"Person"}));

  EXPECT_THROW(store.updateNode({.id = "Z", .attrs = {{"age", 1}}}), quasar::NotFoundError);
  EXPECT_FALSE(store.hasNode("Z"));
}

TEST_F(DirectedStoreTest, UpdateNodeCanReplaceLabels)
{
  store.updateNode({.id = "A", .labels = std::vector<std::string>{"Admin", "Admin"}});
  EXPECT_EQ(store.getNode("A").props["labels"], Value::array({"Admin"}));
}

TEST_F(DirectedStoreTest, MergePatchNullRemovesAttribute)
{
  store.updateNode({.id = "A", .attrs = {{"age", nullptr}}});
  auto props = store.getNode("A").props;
  EXPECT_FALSE(props.contains("age"));
  EXPECT_EQ(props["name"], "Alice");
}

TEST_F(DirectedStoreTest, MergePatchRecursesIntoObjects)
{
  store.updateNode({.id = "A", .attrs = {{"address", {{"city", "Paris"}, {"zip", "75001"}}}}});
  store.updateNode({.id = "A", .attrs = {{"address", {{"zip", nullptr}}}}});
  auto props = store.getNode("A").props;
  EXPECT_EQ(props["address"]["city"], "Paris");
  EXPECT_FALSE(props["address"].contains("zip"));
}

TEST_F(DirectedStoreTest, SetNodeLabelsAddsAndRemoves)
{
  store.setNodeLabels({.id = "A", .addLabels = {"Admin", "Person"}, .removeLabels = {"Ghost"}});
  EXPECT_EQ(store.getNode("A").props["labels"], Value::array({"Person", "Admin"}));

  store.setNodeLabels({.id = "A", .removeLabels = {"Person"}});
  EXPECT_EQ(store.getNode("A").props["labels"], Value::array({"Admin"}));

  EXPECT_THROW(store.setNodeLabels({.id = "Z", .addLabels = {"X"}}), quasar::NotFoundError);
}

TEST_F(DirectedStoreTest, RemoveNodeCascadesToRelationships)
{
  EXPECT_TRUE(store.removeNode("B"));
  EXPECT_FALSE(store.hasNode("B"));
  EXPECT_EQ(store.relationshipCount(), 0u);
  for (const auto &[key, rel] : store.relationships())
  {
    EXPECT_NE(rel.source, "B");
    EXPECT_NE(rel.target, "B");
  }
  EXPECT_TRUE(store.neighbors("A").empty());
  EXPECT_EQ(store.degree("A"), 0u);
  EXPECT_EQ(store.degree("C"), 0u);
}

TEST_F(DirectedStoreTest, RemoveAbsentIsNoOp)
{
  EXPECT_FALSE(store.removeNode("Z"));
  EXPECT_FALSE(store.removeRelationship("A", "C"));
  EXPECT_FALSE(store.removeRelationship("B", "A"));
  EXPECT_EQ(store.nodeCount(), 3u);
  EXPECT_EQ(store.relationshipCount(), 2u);
}

TEST_F(DirectedStoreTest, ClearEmptiesTheGraph)
{
  store.clear();
  EXPECT_EQ(store.nodeCount(), 0u);
  EXPECT_EQ(store.relationshipCount(), 0u);
  EXPECT_FALSE(store.hasNode("A"));
}

// -------------------- relationship writes ---------------------------

TEST_F(DirectedStoreTest, RelationshipToMissingNodeThrowsReferenceError)
{
  EXPECT_THROW(store.addRelationship({.source = "A", .target = "Z"}), quasar::ReferenceError);
  EXPECT_THROW(store.addRelationship({.source = "Z", .target = "A"}), quasar::ReferenceError);
  EXPECT_THROW(store.setRelationship({.source = "A", .target = "Z"}), quasar::ReferenceError);

  EXPECT_EQ(store.relationshipCount(), 2u);
  EXPECT_FALSE(store.hasRelationship("A", "Z"));
  EXPECT_FALSE(store.hasNode("Z"));
}

TEST_F(DirectedStoreTest, AddRelationshipReplacesWholesale)
{
  store.addRelationship({.source = "A", .target = "B", .type = "KNOWS", .attrs = {{"w", 1}}});
  auto props = store.getRelationship("A", "B").props;
  EXPECT_EQ(props["type"], "KNOWS");
  EXPECT_EQ(props["w"], 1);
  EXPECT_FALSE(props.contains("since"));
  EXPECT_EQ(store.relationshipCount(), 2u);
}

TEST_F(DirectedStoreTest, ReverseOrientationIsASeparateRelationship)
{
  store.addRelationship({.source = "B", .target = "A"});
  EXPECT_EQ(store.relationshipCount(), 3u);
  EXPECT_TRUE(store.hasRelationship("B", "A"));
  EXPECT_EQ(store.getRelationship("B", "A").props["type"], nullptr);
  EXPECT_EQ(store.getRelationship("A", "B").props["type"], "FRIEND_OF");
}

TEST_F(DirectedStoreTest, SetRelationshipCreatesThenMerges)
{
  store.setRelationship({.source = "A", .target = "C", .attrs = {{"w", 1}}});
  EXPECT_EQ(store.getRelationship("A", "C").props["type"], nullptr);

  store.setRelationship({.source = "A", .target = "C", .type = "VISITED", .attrs = {{"x", 2}}});
  auto props = store.getRelationship("A", "C").props;
  EXPECT_EQ(props["w"], 1);
  EXPECT_EQ(props["x"], 2);
  EXPECT_EQ(props["type"], "VISITED");

  // the type survives a set without one
  store.setRelationship({.source = "A", .target = "C", .attrs = {{"w", nullptr}}});
  props = store.getRelationship("A", "C").props;
  EXPECT_EQ(props["type"], "VISITED");
  EXPECT_FALSE(props.contains("w"));
}

TEST_F(DirectedStoreTest, UpdateRelationshipMergesAndFailsWhenAbsent)
{
  store.updateRelationship({.source = "A", .target = "B", .type = "BEST_FRIEND_OF", .attrs = {{"since", 2011}}});
  auto props = store.getRelationship("A", "B").props;
  EXPECT_EQ(props["type"], "BEST_FRIEND_OF");
  EXPECT_EQ(props["since"], 2011);

  EXPECT_THROW(store.updateRelationship({.source = "B", .target = "A"}), quasar::NotFoundError);
  EXPECT_FALSE(store.hasRelationship("B", "A"));
}

TEST_F(DirectedStoreTest, UpdateRelationshipWithMissingEndpointIsNotFound)
{
  EXPECT_THROW(store.updateRelationship({.source = "A", .target = "Z"}), quasar::NotFoundError);
  EXPECT_THROW(store.updateRelationship({.source = "Z", .target = "A", .attrs = {{"w", 1}}}), quasar::NotFoundError);
  EXPECT_FALSE(store.hasNode("Z"));
  EXPECT_EQ(store.relationshipCount(), 2u);
}

TEST_F(DirectedStoreTest, RemoveRelationshipDetachesBothEndpoints)
{
  EXPECT_TRUE(store.removeRelationship("A", "B"));
  EXPECT_TRUE(store.neighbors("A").empty());
  EXPECT_TRUE(store.neighbors("B", Direction::In).empty());
  EXPECT_EQ(store.degree("B"), 1u);
  EXPECT_TRUE(store.hasNode("A"));
}

// -------------------- reads ---------------------------

TEST_F(DirectedStoreTest, GetReturnsExportedMappings)
{
  auto node = store.getNode("A");
  EXPECT_EQ(node.id, "A");
  EXPECT_EQ(node.props["labels"], Value::array({"Person"}));
  EXPECT_EQ(node.props["name"], "Alice");
  EXPECT_FALSE(node.props.contains("id"));

  auto rel = store.getRelationship("A", "B");
  EXPECT_EQ(rel.source, "A");
  EXPECT_EQ(rel.target, "B");
  EXPECT_EQ(rel.props["type"], "FRIEND_OF");
  EXPECT_EQ(rel.props["since"], 2010);

  EXPECT_THROW(store.getNode("Z"), quasar::NotFoundError);
  EXPECT_THROW(store.getRelationship("B", "A"), quasar::NotFoundError);
}

TEST_F(DirectedStoreTest, NeighborsRespectDirection)
{
  EXPECT_EQ(store.neighbors("A"), std::vector<NodeId>{"B"});
  EXPECT_EQ(store.neighbors("B", Direction::In), std::vector<NodeId>{"A"});
  EXPECT_TRUE(store.neighbors("C").empty());

  auto both = store.neighbors("B", Direction::Both);
  EXPECT_EQ(both.size(), 2u);
  EXPECT_TRUE(contains(both, "A"));
  EXPECT_TRUE(contains(both, "C"));
}

TEST_F(DirectedStoreTest, DegreeRespectsDirection)
{
  EXPECT_EQ(store.degree("B"), 2u);
  EXPECT_EQ(store.degree("B", Direction::Out), 1u);
  EXPECT_EQ(store.degree("B", Direction::In), 1u);
  EXPECT_EQ(store.degree("A"), 1u);
  EXPECT_EQ(store.degree("A", Direction::In), 0u);
}

TEST_F(DirectedStoreTest, SelfLoopCountsOnce)
{
  store.addRelationship({.source = "A", .target = "A"});
  EXPECT_EQ(store.degree("A"), 2u);
  auto both = store.neighbors("A", Direction::Both);
  EXPECT_EQ(both.size(), 2u);
  EXPECT_TRUE(contains(both, "A"));
  EXPECT_EQ(store.neighbors("A", Direction::In), std::vector<NodeId>{"A"});
}

TEST_F(DirectedStoreTest, AdjacencyOfMissingNodeThrows)
{
  EXPECT_THROW(store.neighbors("Z"), quasar::NotFoundError);
  EXPECT_THROW(store.degree("Z"), quasar::NotFoundError);
  EXPECT_THROW(store.listAdjacency("Z", Direction::Both), quasar::NotFoundError);
}

TEST_F(DirectedStoreTest, ListAdjacencyReportsOrientation)
{
  auto rows = store.listAdjacency("B", Direction::Both);
  ASSERT_EQ(rows.size(), 2u);
  for (const auto &a : rows)
  {
    if (a.neighborId == "A")
      EXPECT_EQ(a.direction, Direction::In);
    else
      EXPECT_EQ(a.direction, Direction::Out);
    ASSERT_NE(a.rel, nullptr);
  }
}

// -------------------- queries ---------------------------

TEST_F(DirectedStoreTest, FindNodesWithOrCondition)
{
  Value where = {{"_logic", "or"}, {"name", "Alice"}, {"age", {{"gt", 35}}}};
  auto rows = store.findNodes({.label = "Person", .where = quasar::Condition::parse(where)});
  EXPECT_EQ(idsOf(rows), std::vector<NodeId>{"A"});
}

TEST_F(DirectedStoreTest, FindNodesByLabelOnly)
{
  auto rows = store.findNodes({.label = "Person"});
  EXPECT_EQ(idsOf(rows), (std::vector<NodeId>{"A", "B"}));
  EXPECT_EQ(store.findNodes({}).size(), 3u);
  EXPECT_TRUE(store.findNodes({.label = "Robot"}).empty());
}

TEST_F(DirectedStoreTest, FindNodesProjectsFields)
{
  auto rows = store.findNodes({.label = "Person", .fields = {"name", "missing"}});
  ASSERT_EQ(rows.size(), 2u);
  for (const auto &r : rows)
  {
    EXPECT_EQ(r.props.size(), 1u);
    EXPECT_TRUE(r.props.contains("name"));
    EXPECT_FALSE(r.props.contains("missing"));
  }
}

TEST_F(DirectedStoreTest, FindNodesCanFilterOnLabels)
{
  Value where = {{"labels", Value::array({"City"})}};
  auto rows = store.findNodes({.where = quasar::Condition::parse(where)});
  EXPECT_EQ(idsOf(rows), std::vector<NodeId>{"C"});
}

TEST_F(DirectedStoreTest, FindRelationshipsFilters)
{
  EXPECT_EQ(store.findRelationships({}).size(), 2u);

  auto byType = store.findRelationships({.type = "FRIEND_OF"});
  ASSERT_EQ(byType.size(), 1u);
  EXPECT_EQ(byType[0].source, "A");

  auto bySource = store.findRelationships({.source = NodeId("B")});
  ASSERT_EQ(bySource.size(), 1u);
  EXPECT_EQ(bySource[0].target, "C");

  auto byTarget = store.findRelationships({.target = NodeId("B")});
  ASSERT_EQ(byTarget.size(), 1u);
  EXPECT_EQ(byTarget[0].source, "A");

  EXPECT_EQ(store.findRelationships({.source = NodeId("A"), .target = NodeId("B")}).size(), 1u);
  EXPECT_TRUE(store.findRelationships({.source = NodeId("B"), .target = NodeId("A")}).empty());

  Value where = {{"since", {{"gte", 2010}}}};
  auto rows = store.findRelationships({.where = quasar::Condition::parse(where), .fields = {"since"}});
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].props, (Value{{"since", 2010}}));
}

// -------------------- undirected ---------------------------

TEST_F(UndirectedStoreTest, ReverseAddOverwritesTheSameRelationship)
{
  store.addRelationship({.source = "B", .target = "A", .type = "KNOWS"});
  EXPECT_EQ(store.relationshipCount(), 1u);
  EXPECT_TRUE(store.hasRelationship("B", "A"));
  EXPECT_TRUE(store.hasRelationship("A", "B"));
  EXPECT_EQ(store.getRelationship("A", "B").props["type"], "KNOWS");
}

TEST_F(UndirectedStoreTest, NeighborsIgnoreDirection)
{
  EXPECT_EQ(store.neighbors("B"), std::vector<NodeId>{"A"});
  EXPECT_EQ(store.neighbors("A", Direction::In), std::vector<NodeId>{"B"});
  EXPECT_EQ(store.degree("A"), 1u);
  EXPECT_EQ(store.degree("B", Direction::In), 1u);
  EXPECT_EQ(store.degree("C"), 0u);
}

TEST_F(UndirectedStoreTest, RemoveRelationshipInEitherOrder)
{
  EXPECT_TRUE(store.removeRelationship("B", "A"));
  EXPECT_EQ(store.relationshipCount(), 0u);
  EXPECT_TRUE(store.neighbors("A").empty());
}

TEST_F(UndirectedStoreTest, UpdateInEitherOrder)
{
  store.updateRelationship({.source = "B", .target = "A", .attrs = {{"w", 3}}});
  EXPECT_EQ(store.getRelationship("A", "B").props["w"], 3);
}

TEST_F(UndirectedStoreTest, EndpointFiltersMatchEitherOrientation)
{
  EXPECT_EQ(store.findRelationships({.source = NodeId("B")}).size(), 1u);
  EXPECT_EQ(store.findRelationships({.target = NodeId("A")}).size(), 1u);
  EXPECT_EQ(store.findRelationships({.source = NodeId("B"), .target = NodeId("A")}).size(), 1u);
  EXPECT_TRUE(store.findRelationships({.source = NodeId("C")}).empty());
}

TEST_F(UndirectedStoreTest, ModeIsReported)
{
  EXPECT_EQ(store.mode(), quasar::GraphMode::Undirected);
}
