#include "encode.hpp"
#include "errors.hpp"
#include "store.hpp"
#include <algorithm>
#include <set>
#include <string>

namespace quasar
{

  static std::string describe(const Value &entry)
  {
    return entry.dump(-1, ' ', false, Value::error_handler_t::replace);
  }

  static NodeId decode_id(const Value &entry, const char *key)
  {
    auto it = entry.find(key);
    if (it == entry.end())
      throw PersistenceError(std::string("missing \"") + key + "\" in " + describe(entry));
    if (!isValidNodeId(*it))
      throw PersistenceError(std::string("\"") + key + "\" must be a string or integer in " + describe(entry));
    return *it;
  }

  bool isValidNodeId(const NodeId &id)
  {
    return id.is_string() || id.is_number_integer();
  }

  Value exportNode(const Node &n)
  {
    Value out = n.attrs.is_object() ? n.attrs : Value::object();
    out[kLabelsKey] = n.labels;
    return out;
  }

  Value exportRelationship(const Relationship &r)
  {
    Value out = r.attrs.is_object() ? r.attrs : Value::object();
    out[kTypeKey] = r.type ? Value(*r.type) : Value(nullptr);
    return out;
  }

  Value encodeNode(const Node &n)
  {
    Value out = exportNode(n);
    out[kIdKey] = n.id;
    return out;
  }

  Value encodeRelationship(const Relationship &r)
  {
    Value out = exportRelationship(r);
    out[kSourceKey] = r.source;
    out[kTargetKey] = r.target;
    return out;
  }

  Node decodeNode(const Value &entry)
  {
    if (!entry.is_object())
      throw PersistenceError("node entry must be an object: " + describe(entry));

    Node n{};
    n.id = decode_id(entry, kIdKey);
    for (auto it = entry.begin(); it != entry.end(); ++it)
    {
      if (it.key() == kIdKey)
        continue;
      if (it.key() == kLabelsKey)
      {
        if (it->is_null())
          continue;
        if (!it->is_array())
          throw PersistenceError("\"labels\" must be an array in " + describe(entry));
        for (const auto &l : *it)
        {
          if (!l.is_string())
            throw PersistenceError("non-string label in " + describe(entry));
          const auto &name = l.get_ref<const std::string &>();
          if (std::find(n.labels.begin(), n.labels.end(), name) == n.labels.end())
            n.labels.push_back(name);
        }
        continue;
      }
      n.attrs[it.key()] = it.value();
    }
    return n;
  }

  Relationship decodeRelationship(const Value &entry)
  {
    if (!entry.is_object())
      throw PersistenceError("relationship entry must be an object: " + describe(entry));

    Relationship r{};
    r.source = decode_id(entry, kSourceKey);
    r.target = decode_id(entry, kTargetKey);
    for (auto it = entry.begin(); it != entry.end(); ++it)
    {
      if (it.key() == kSourceKey || it.key() == kTargetKey)
        continue;
      if (it.key() == kTypeKey)
      {
        if (it->is_string())
          r.type = it->get<std::string>();
        else if (!it->is_null())
          throw PersistenceError("\"type\" must be a string or null in " + describe(entry));
        continue;
      }
      r.attrs[it.key()] = it.value();
    }
    return r;
  }

  Value encodeGraph(const Store &store)
  {
    Value nodes = Value::array();
    for (const auto &[id, n] : store.nodes())
      nodes.push_back(encodeNode(n));

    Value rels = Value::array();
    for (const auto &[key, r] : store.relationships())
      rels.push_back(encodeRelationship(r));

    Value doc = Value::object();
    doc["nodes"] = std::move(nodes);
    doc["relationships"] = std::move(rels);
    return doc;
  }

  GraphDocument decodeGraph(const Value &doc)
  {
    if (!doc.is_object())
      throw PersistenceError("graph document must be an object");
    auto nodesIt = doc.find("nodes");
    auto relsIt = doc.find("relationships");
    if (nodesIt == doc.end() || !nodesIt->is_array())
      throw PersistenceError("graph document lacks a \"nodes\" array");
    if (relsIt == doc.end() || !relsIt->is_array())
      throw PersistenceError("graph document lacks a \"relationships\" array");

    GraphDocument out{};
    std::set<NodeId> ids;
    out.nodes.reserve(nodesIt->size());
    for (const auto &entry : *nodesIt)
    {
      out.nodes.push_back(decodeNode(entry));
      ids.insert(out.nodes.back().id);
    }

    out.relationships.reserve(relsIt->size());
    for (const auto &entry : *relsIt)
    {
      Relationship r = decodeRelationship(entry);
      if (!ids.count(r.source) || !ids.count(r.target))
        throw PersistenceError("relationship references an unknown node: " + describe(entry));
      out.relationships.push_back(std::move(r));
    }
    return out;
  }

} // namespace quasar
