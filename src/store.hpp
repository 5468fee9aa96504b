#pragma once
#include "env.hpp"
#include "encode.hpp"
#include "condition.hpp"
#include "policy.hpp"
#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quasar
{

  struct FindNodesParams
  {
    std::optional<std::string> label{};
    Condition where{};
    std::vector<std::string> fields{}; // empty -> full mapping
  };

  struct FindRelationshipsParams
  {
    std::optional<std::string> type{};
    std::optional<NodeId> source{};
    std::optional<NodeId> target{};
    Condition where{};
    std::vector<std::string> fields{};
  };

  // Owns every node and relationship of one graph. Each mutation rewrites the
  // Env's backing file before returning, unless the Env is memory-only; if
  // that write fails the mutation is rolled back and PersistenceError thrown.
  //
  // Failure policies:
  //   add*     create or replace wholesale
  //   set*     create, or merge-patch into the existing record
  //   update*  merge-patch; NotFoundError when absent
  //   remove*  no-op (returns false) when absent
  // add/setRelationship throw ReferenceError when an endpoint is missing.
  class Store
  {
  public:
    using NodeMap = std::map<NodeId, Node>;
    using RelationshipMap = std::map<RelKey, Relationship>;
    using IncidenceMap = std::map<NodeId, std::set<RelKey>>;

    // loads the Env's file when it exists; PersistenceError if malformed
    explicit Store(Env &e, GraphMode mode = GraphMode::Undirected);
    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    // writes
    void addNode(const AddNodeParams &params);
    void setNode(const SetNodeParams &params);
    void updateNode(const UpdateNodeParams &params);
    void setNodeLabels(const SetNodeLabelsParams &params);
    bool removeNode(const NodeId &id);

    void addRelationship(const AddRelationshipParams &params);
    void setRelationship(const SetRelationshipParams &params);
    void updateRelationship(const UpdateRelationshipParams &params);
    bool removeRelationship(const NodeId &source, const NodeId &target);

    void clear();
    // replaces the whole graph with the contents of path
    void load(const std::filesystem::path &path);

    // reads / queries
    NodeMatch getNode(const NodeId &id) const;
    RelationshipMatch getRelationship(const NodeId &source, const NodeId &target) const;
    bool hasNode(const NodeId &id) const;
    bool hasRelationship(const NodeId &source, const NodeId &target) const;
    size_t nodeCount() const { return nodes_.size(); }
    size_t relationshipCount() const { return rels_.size(); }

    GraphMode mode() const { return policy_->mode(); }

    std::vector<Adjacency> listAdjacency(const NodeId &node, Direction direction) const;
    std::vector<NodeId> neighbors(const NodeId &node, Direction direction = Direction::Out) const;
    uint64_t degree(const NodeId &node, Direction direction = Direction::Both) const;

    std::vector<NodeMatch> findNodes(const FindNodesParams &params) const;
    std::vector<RelationshipMatch> findRelationships(const FindRelationshipsParams &params) const;

    // explicit writes; the second leaves the default path unchanged
    void save() const;
    void save(const std::filesystem::path &path) const;

    const NodeMap &nodes() const { return nodes_; }
    const RelationshipMap &relationships() const { return rels_; }

  private:
    // Copy of the graph taken before a mutation. Unless commit() persists the
    // new state, the destructor puts the copy back.
    class WriteTxn
    {
    public:
      explicit WriteTxn(Store &s);
      ~WriteTxn() noexcept;
      WriteTxn(const WriteTxn &) = delete;
      WriteTxn &operator=(const WriteTxn &) = delete;

      void commit();

    private:
      Store &store_;
      bool armed_{false};
      NodeMap nodes_{};
      RelationshipMap rels_{};
      IncidenceMap incident_{};
    };

    const Node &requireNode(const NodeId &id) const;
    void linkRelationship(const RelKey &key, Relationship rel);
    void replaceContents(GraphDocument &&doc);
    void persist() const;

    Env &env_;
    std::unique_ptr<TraversalPolicy> policy_;
    NodeMap nodes_{};
    RelationshipMap rels_{};
    IncidenceMap incident_{};
  };

} // namespace quasar
