#include "matcher.hpp"
#include "encode.hpp"
#include "errors.hpp"
#include "projection.hpp"
#include <algorithm>
#include <utility>

namespace quasar
{

  static bool node_passes(const Node &n, const std::optional<std::string> &label, const Condition &cond)
  {
    if (label && std::find(n.labels.begin(), n.labels.end(), *label) == n.labels.end())
      return false;
    return cond.matches(exportNode(n));
  }

  static NodeMatch render_node(const Node &n, const std::vector<std::string> &fields)
  {
    return NodeMatch{n.id, project(exportNode(n), fields)};
  }

  static RelationshipMatch render_rel(const Relationship &r, const std::vector<std::string> &fields)
  {
    return RelationshipMatch{r.source, r.target, project(exportRelationship(r), fields)};
  }

  // -------------------- pattern ---------------------------

  bool TypeFilter::accepts(const Relationship &rel) const
  {
    switch (kind)
    {
    case TypeFilterKind::Untyped:
      return !rel.type.has_value();
    case TypeFilterKind::Named:
      return rel.type.has_value() && *rel.type == name;
    case TypeFilterKind::Any:
    default:
      return true;
    }
  }

  Direction parseDirection(std::string_view token)
  {
    if (token == "out")
      return Direction::Out;
    if (token == "in")
      return Direction::In;
    if (token == "any")
      return Direction::Both;
    throw ValidationError("unknown direction: " + std::string(token));
  }

  std::vector<PatternStep> parsePattern(const Value &doc)
  {
    if (doc.is_null())
      return {};
    if (!doc.is_array())
      throw ValidationError("pattern must be an array of steps");

    std::vector<PatternStep> steps;
    steps.reserve(doc.size());
    for (const auto &s : doc)
    {
      if (!s.is_object())
        throw ValidationError("pattern step must be an object");
      PatternStep step{};
      for (auto it = s.begin(); it != s.end(); ++it)
      {
        const auto &key = it.key();
        if (key == "rel_type")
        {
          if (it->is_null())
            step.relType = TypeFilter::untyped();
          else if (it->is_string())
            step.relType = TypeFilter::named(it->get<std::string>());
          else
            throw ValidationError("rel_type must be a string or null");
        }
        else if (key == "label")
        {
          if (it->is_string())
            step.label = it->get<std::string>();
          else if (!it->is_null())
            throw ValidationError("label must be a string");
        }
        else if (key == "node")
          step.node = Condition::parse(*it);
        else
          throw ValidationError("unknown pattern step key: " + key);
      }
      steps.push_back(std::move(step));
    }
    return steps;
  }

  Value toJson(const StructuredPath &path)
  {
    Value out = Value::array();
    for (const auto &el : path)
    {
      if (const auto *n = std::get_if<NodeMatch>(&el))
      {
        Value props = n->props;
        Value obj = {{"id", n->id}};
        if (auto it = props.find(kLabelsKey); it != props.end())
        {
          obj[kLabelsKey] = *it;
          props.erase(it);
        }
        obj["properties"] = std::move(props);
        out.push_back(std::move(obj));
        continue;
      }
      const auto &r = std::get<RelationshipMatch>(el);
      Value props = r.props;
      Value obj = {{kSourceKey, r.source}, {kTargetKey, r.target}};
      if (auto it = props.find(kTypeKey); it != props.end())
      {
        obj[kTypeKey] = *it;
        props.erase(it);
      }
      obj["properties"] = std::move(props);
      out.push_back(std::move(obj));
    }
    return out;
  }

  // -------------------- traversal ---------------------------

  std::vector<Matcher::Trail> Matcher::traverse(const MatchParams &params) const
  {
    std::vector<Trail> results;
    for (const auto &[id, n] : store_.nodes())
    {
      if (!node_passes(n, params.startLabel, params.start))
        continue;

      // each start node's branch is independent of the others
      std::vector<Trail> frontier{Trail{{&n}, {}}};
      for (const auto &step : params.pattern)
      {
        frontier = expand(frontier, step, params.direction);
        if (frontier.empty())
          break;
      }
      for (auto &t : frontier)
        results.push_back(std::move(t));
    }
    return results;
  }

  std::vector<Matcher::Trail> Matcher::expand(const std::vector<Trail> &frontier, const PatternStep &step,
                                              Direction direction) const
  {
    std::vector<Trail> next;
    for (const auto &trail : frontier)
    {
      const Node *tail = trail.nodes.back();
      for (const auto &adj : store_.listAdjacency(tail->id, direction))
      {
        if (!step.relType.accepts(*adj.rel))
          continue;
        const Node &neighbor = store_.nodes().at(adj.neighborId);
        if (!node_passes(neighbor, step.label, step.node))
          continue;
        Trail t = trail;
        t.nodes.push_back(&neighbor);
        t.rels.push_back(adj.rel);
        next.push_back(std::move(t));
      }
    }
    return next;
  }

  // -------------------- renderings ---------------------------

  std::vector<std::vector<NodeMatch>> Matcher::matchNodes(const MatchParams &params) const
  {
    std::vector<std::vector<NodeMatch>> out;
    for (const auto &t : traverse(params))
    {
      std::vector<NodeMatch> row;
      row.reserve(t.nodes.size());
      for (const Node *n : t.nodes)
        row.push_back(render_node(*n, params.nodeFields));
      out.push_back(std::move(row));
    }
    return out;
  }

  std::vector<std::vector<NodeId>> Matcher::matchNodeIds(const MatchParams &params) const
  {
    std::vector<std::vector<NodeId>> out;
    for (const auto &t : traverse(params))
    {
      std::vector<NodeId> row;
      row.reserve(t.nodes.size());
      for (const Node *n : t.nodes)
        row.push_back(n->id);
      out.push_back(std::move(row));
    }
    return out;
  }

  std::vector<Path> Matcher::matchPaths(const MatchParams &params) const
  {
    std::vector<Path> out;
    for (const auto &t : traverse(params))
    {
      Path p{};
      for (const Node *n : t.nodes)
        p.nodes.push_back(render_node(*n, params.nodeFields));
      for (const Relationship *r : t.rels)
        p.relationships.push_back(render_rel(*r, params.relFields));
      out.push_back(std::move(p));
    }
    return out;
  }

  std::vector<StructuredPath> Matcher::matchStructured(const MatchParams &params) const
  {
    std::vector<StructuredPath> out;
    for (const auto &t : traverse(params))
    {
      StructuredPath p;
      p.reserve(t.nodes.size() + t.rels.size());
      p.push_back(render_node(*t.nodes.front(), params.nodeFields));
      for (size_t i = 0; i < t.rels.size(); ++i)
      {
        p.push_back(render_rel(*t.rels[i], params.relFields));
        p.push_back(render_node(*t.nodes[i + 1], params.nodeFields));
      }
      out.push_back(std::move(p));
    }
    return out;
  }

} // namespace quasar
