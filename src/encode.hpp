#pragma once
#include "types.hpp"
#include <vector>

namespace quasar
{

  class Store;

  // decoded contents of a graph file, in document order
  struct GraphDocument
  {
    std::vector<Node> nodes;
    std::vector<Relationship> relationships;
  };

  // ids are strings or integers
  bool isValidNodeId(const NodeId &id);

  // -------------------- exported mappings ---------------------------

  // attrs plus "labels"
  Value exportNode(const Node &n);
  // attrs plus "type" (null when untyped)
  Value exportRelationship(const Relationship &r);

  // -------------------- wire objects ---------------------------

  // {"id": .., "labels": [..], <attr>: ..}
  Value encodeNode(const Node &n);
  // {"source": .., "target": .., "type": ..|null, <attr>: ..}
  Value encodeRelationship(const Relationship &r);

  // throw PersistenceError on a malformed entry
  Node decodeNode(const Value &entry);
  Relationship decodeRelationship(const Value &entry);

  // {"nodes": [..], "relationships": [..]}
  Value encodeGraph(const Store &store);
  // whole-document checks, including relationship endpoints; throws PersistenceError
  GraphDocument decodeGraph(const Value &doc);

} // namespace quasar
