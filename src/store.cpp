#include "store.hpp"
#include "errors.hpp"
#include "projection.hpp"
#include <algorithm>
#include <initializer_list>
#include <utility>
#include <kj/debug.h>

namespace quasar
{

  // -------------------- validation helpers --------------------

  static std::string show(const NodeId &id)
  {
    return id.dump(-1, ' ', false, Value::error_handler_t::replace);
  }

  static void check_node_id(const NodeId &id)
  {
    if (!isValidNodeId(id))
      throw ValidationError("node id must be a string or integer, got " + show(id));
  }

  static Value checked_attrs(const Value &attrs, std::initializer_list<const char *> reserved)
  {
    if (attrs.is_null())
      return Value::object();
    if (!attrs.is_object())
      throw ValidationError("attributes must be an object, got " + std::string(attrs.type_name()));
    for (const char *key : reserved)
    {
      if (attrs.contains(key))
        throw ValidationError(std::string("attribute key \"") + key + "\" is reserved");
    }
    return attrs;
  }

  static Value checked_node_attrs(const Value &attrs)
  {
    return checked_attrs(attrs, {kIdKey, kLabelsKey});
  }

  static Value checked_rel_attrs(const Value &attrs)
  {
    return checked_attrs(attrs, {kSourceKey, kTargetKey, kTypeKey});
  }

  // keeps first occurrences, in order
  static std::vector<std::string> unique_labels(const std::vector<std::string> &labels)
  {
    std::vector<std::string> out;
    out.reserve(labels.size());
    for (const auto &l : labels)
    {
      if (std::find(out.begin(), out.end(), l) == out.end())
        out.push_back(l);
    }
    if (out.size() != labels.size())
      KJ_LOG(WARNING, "dropped duplicate labels", labels.size() - out.size());
    return out;
  }

  static bool has_label(const Node &n, const std::string &label)
  {
    return std::find(n.labels.begin(), n.labels.end(), label) != n.labels.end();
  }

  static void check_endpoints(const Store::NodeMap &nodes, const NodeId &source, const NodeId &target)
  {
    if (!nodes.count(source))
      throw ReferenceError("relationship source " + show(source) + " does not exist");
    if (!nodes.count(target))
      throw ReferenceError("relationship target " + show(target) + " does not exist");
  }

  // -------------------- construction --------------------

  Store::Store(Env &e, GraphMode mode) : env_(e), policy_(makeTraversalPolicy(mode))
  {
    if (auto doc = env_.read())
    {
      replaceContents(decodeGraph(*doc));
      KJ_LOG(INFO, "loaded graph", env_.path().c_str(), nodes_.size(), rels_.size());
    }
  }

  // -------------------- node writes --------------------

  void Store::addNode(const AddNodeParams &params)
  {
    check_node_id(params.id);
    Node n{};
    n.id = params.id;
    n.labels = unique_labels(params.labels);
    n.attrs = checked_node_attrs(params.attrs);

    WriteTxn txn(*this);
    nodes_[params.id] = std::move(n);
    txn.commit();
  }

  void Store::setNode(const SetNodeParams &params)
  {
    check_node_id(params.id);
    Value patch = checked_node_attrs(params.attrs);
    std::optional<std::vector<std::string>> labels;
    if (params.labels)
      labels = unique_labels(*params.labels);

    WriteTxn txn(*this);
    auto it = nodes_.find(params.id);
    if (it == nodes_.end())
    {
      Node n{};
      n.id = params.id;
      n.labels = labels.value_or(std::vector<std::string>{});
      n.attrs.merge_patch(patch);
      nodes_.emplace(params.id, std::move(n));
    }
    else
    {
      it->second.attrs.merge_patch(patch);
      if (labels)
        it->second.labels = std::move(*labels);
    }
    txn.commit();
  }

  void Store::updateNode(const UpdateNodeParams &params)
  {
    Value patch = checked_node_attrs(params.attrs);
    auto it = nodes_.find(params.id);
    if (it == nodes_.end())
      throw NotFoundError("node " + show(params.id) + " does not exist");

    std::optional<std::vector<std::string>> labels;
    if (params.labels)
      labels = unique_labels(*params.labels);

    WriteTxn txn(*this);
    it->second.attrs.merge_patch(patch);
    if (labels)
      it->second.labels = std::move(*labels);
    txn.commit();
  }

  void Store::setNodeLabels(const SetNodeLabelsParams &params)
  {
    auto it = nodes_.find(params.id);
    if (it == nodes_.end())
      throw NotFoundError("node " + show(params.id) + " does not exist");

    WriteTxn txn(*this);
    auto &labels = it->second.labels;
    // remove
    labels.erase(std::remove_if(labels.begin(), labels.end(), [&](const std::string &l)
                                { return std::find(params.removeLabels.begin(), params.removeLabels.end(), l) != params.removeLabels.end(); }),
                 labels.end());
    // add
    for (const auto &l : params.addLabels)
    {
      if (std::find(labels.begin(), labels.end(), l) == labels.end())
        labels.push_back(l);
    }
    txn.commit();
  }

  bool Store::removeNode(const NodeId &id)
  {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
    {
      KJ_LOG(WARNING, "removeNode: no such node", show(id).c_str());
      return false;
    }

    WriteTxn txn(*this);
    // cascade to every relationship touching the node
    auto inc = incident_.find(id);
    if (inc != incident_.end())
    {
      std::set<RelKey> keys = std::move(inc->second);
      incident_.erase(inc);
      for (const auto &key : keys)
      {
        auto rit = rels_.find(key);
        if (rit == rels_.end())
          continue;
        const NodeId &other = rit->second.source == id ? rit->second.target : rit->second.source;
        auto oit = incident_.find(other);
        if (oit != incident_.end())
        {
          oit->second.erase(key);
          if (oit->second.empty())
            incident_.erase(oit);
        }
        rels_.erase(rit);
      }
    }

    nodes_.erase(it);
    txn.commit();
    return true;
  }

  // -------------------- relationship writes --------------------

  void Store::addRelationship(const AddRelationshipParams &params)
  {
    check_endpoints(nodes_, params.source, params.target);
    Relationship r{};
    r.source = params.source;
    r.target = params.target;
    r.type = params.type;
    r.attrs = checked_rel_attrs(params.attrs);

    WriteTxn txn(*this);
    linkRelationship(policy_->key(params.source, params.target), std::move(r));
    txn.commit();
  }

  void Store::setRelationship(const SetRelationshipParams &params)
  {
    check_endpoints(nodes_, params.source, params.target);
    Value patch = checked_rel_attrs(params.attrs);

    WriteTxn txn(*this);
    auto key = policy_->key(params.source, params.target);
    auto it = rels_.find(key);
    if (it == rels_.end())
    {
      Relationship r{};
      r.source = params.source;
      r.target = params.target;
      r.type = params.type;
      r.attrs.merge_patch(patch);
      linkRelationship(key, std::move(r));
    }
    else
    {
      it->second.attrs.merge_patch(patch);
      if (params.type)
        it->second.type = params.type;
    }
    txn.commit();
  }

  // a missing endpoint means a missing relationship: NotFoundError, not ReferenceError
  void Store::updateRelationship(const UpdateRelationshipParams &params)
  {
    Value patch = checked_rel_attrs(params.attrs);

    auto it = rels_.find(policy_->key(params.source, params.target));
    if (it == rels_.end())
      throw NotFoundError("relationship " + show(params.source) + " -> " + show(params.target) + " does not exist");

    WriteTxn txn(*this);
    it->second.attrs.merge_patch(patch);
    if (params.type)
      it->second.type = params.type;
    txn.commit();
  }

  bool Store::removeRelationship(const NodeId &source, const NodeId &target)
  {
    auto key = policy_->key(source, target);
    auto it = rels_.find(key);
    if (it == rels_.end())
    {
      KJ_LOG(WARNING, "removeRelationship: no such relationship", show(source).c_str(), show(target).c_str());
      return false;
    }

    WriteTxn txn(*this);
    for (const NodeId *endpoint : {&it->second.source, &it->second.target})
    {
      auto inc = incident_.find(*endpoint);
      if (inc == incident_.end())
        continue;
      inc->second.erase(key);
      if (inc->second.empty())
        incident_.erase(inc);
    }
    rels_.erase(it);
    txn.commit();
    return true;
  }

  void Store::clear()
  {
    WriteTxn txn(*this);
    nodes_.clear();
    rels_.clear();
    incident_.clear();
    txn.commit();
    KJ_LOG(INFO, "graph cleared");
  }

  void Store::load(const std::filesystem::path &path)
  {
    GraphDocument doc = decodeGraph(Env::readFile(path));
    WriteTxn txn(*this);
    replaceContents(std::move(doc));
    txn.commit();
    KJ_LOG(INFO, "loaded graph", path.c_str(), nodes_.size(), rels_.size());
  }

  // -------------------- reads --------------------

  NodeMatch Store::getNode(const NodeId &id) const
  {
    const Node &n = requireNode(id);
    return NodeMatch{n.id, exportNode(n)};
  }

  RelationshipMatch Store::getRelationship(const NodeId &source, const NodeId &target) const
  {
    auto it = rels_.find(policy_->key(source, target));
    if (it == rels_.end())
      throw NotFoundError("relationship " + show(source) + " -> " + show(target) + " does not exist");
    const Relationship &r = it->second;
    return RelationshipMatch{r.source, r.target, exportRelationship(r)};
  }

  bool Store::hasNode(const NodeId &id) const
  {
    return nodes_.count(id) != 0;
  }

  bool Store::hasRelationship(const NodeId &source, const NodeId &target) const
  {
    return rels_.count(policy_->key(source, target)) != 0;
  }

  std::vector<Adjacency> Store::listAdjacency(const NodeId &node, Direction direction) const
  {
    requireNode(node);
    std::vector<Adjacency> out;
    auto inc = incident_.find(node);
    if (inc == incident_.end())
      return out;
    out.reserve(inc->second.size());
    for (const auto &key : inc->second)
    {
      const Relationship &rel = rels_.at(key);
      if (auto o = policy_->orientation(rel, node, direction))
        out.push_back(Adjacency{neighborOf(rel, *o), &rel, *o});
    }
    return out;
  }

  std::vector<NodeId> Store::neighbors(const NodeId &node, Direction direction) const
  {
    auto rows = listAdjacency(node, direction);
    std::vector<NodeId> ids;
    std::set<NodeId> seen;
    ids.reserve(rows.size());
    for (const auto &a : rows)
    {
      if (seen.insert(a.neighborId).second)
        ids.push_back(a.neighborId);
    }
    return ids;
  }

  uint64_t Store::degree(const NodeId &node, Direction direction) const
  {
    return listAdjacency(node, direction).size();
  }

  std::vector<NodeMatch> Store::findNodes(const FindNodesParams &params) const
  {
    std::vector<NodeMatch> out;
    for (const auto &[id, n] : nodes_)
    {
      if (params.label && !has_label(n, *params.label))
        continue;
      Value mapping = exportNode(n);
      if (!params.where.matches(mapping))
        continue;
      out.push_back(NodeMatch{id, project(mapping, params.fields)});
    }
    return out;
  }

  std::vector<RelationshipMatch> Store::findRelationships(const FindRelationshipsParams &params) const
  {
    std::vector<RelationshipMatch> out;
    for (const auto &[key, r] : rels_)
    {
      if (params.type && r.type != params.type)
        continue;
      // endpoint filters go through the policy so undirected graphs match either orientation
      if (params.source)
      {
        auto o = policy_->orientation(r, *params.source, Direction::Out);
        if (!o || (params.target && neighborOf(r, *o) != *params.target))
          continue;
      }
      else if (params.target && !policy_->orientation(r, *params.target, Direction::In))
        continue;

      Value mapping = exportRelationship(r);
      if (!params.where.matches(mapping))
        continue;
      out.push_back(RelationshipMatch{r.source, r.target, project(mapping, params.fields)});
    }
    return out;
  }

  // -------------------- persistence --------------------

  void Store::save() const
  {
    if (env_.memoryOnly())
    {
      KJ_LOG(INFO, "memory-only store, nothing to save");
      return;
    }
    save(env_.path());
  }

  void Store::save(const std::filesystem::path &path) const
  {
    Env::writeFile(path, encodeGraph(*this));
    KJ_LOG(INFO, "saved graph", path.c_str(), nodes_.size(), rels_.size());
  }

  // -------------------- write transactions --------------------

  Store::WriteTxn::WriteTxn(Store &s) : store_(s)
  {
    // memory-only stores have no write that can fail
    if (store_.env_.memoryOnly())
      return;
    nodes_ = store_.nodes_;
    rels_ = store_.rels_;
    incident_ = store_.incident_;
    armed_ = true;
  }

  Store::WriteTxn::~WriteTxn() noexcept
  {
    if (!armed_)
      return;
    store_.nodes_.swap(nodes_);
    store_.rels_.swap(rels_);
    store_.incident_.swap(incident_);
  }

  void Store::WriteTxn::commit()
  {
    store_.persist();
    armed_ = false;
  }

  const Node &Store::requireNode(const NodeId &id) const
  {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
      throw NotFoundError("node " + show(id) + " does not exist");
    return it->second;
  }

  void Store::linkRelationship(const RelKey &key, Relationship rel)
  {
    incident_[rel.source].insert(key);
    incident_[rel.target].insert(key);
    rels_[key] = std::move(rel);
  }

  void Store::replaceContents(GraphDocument &&doc)
  {
    NodeMap nodes;
    RelationshipMap rels;
    IncidenceMap incident;
    for (auto &n : doc.nodes)
    {
      NodeId id = n.id;
      nodes[id] = std::move(n);
    }
    for (auto &r : doc.relationships)
    {
      auto key = policy_->key(r.source, r.target);
      incident[r.source].insert(key);
      incident[r.target].insert(key);
      rels[key] = std::move(r);
    }
    nodes_.swap(nodes);
    rels_.swap(rels);
    incident_.swap(incident);
  }

  void Store::persist() const
  {
    if (env_.memoryOnly())
      return;
    try
    {
      env_.write(encodeGraph(*this));
    }
    catch (const PersistenceError &e)
    {
      KJ_LOG(ERROR, "graph write failed, rolling back", e.what());
      throw;
    }
  }

} // namespace quasar
